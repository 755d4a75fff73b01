#include <pdfscrub/assert_test.h>

#include "pdf_fixtures.hh"

#include <pdfscrub/TempFileSet.hh>

#include <qpdf/QUtil.hh>

#include <iostream>
#include <stdexcept>

using namespace pdfscrub;

static void
test_cleanup(std::string const& dir)
{
    TempFileSet temps(dir);
    auto a = temps.create();
    auto b = temps.create();
    assert(a != b);
    assert(a.find(dir + "/pdfscrub-") == 0);
    assert(temps.getPaths().size() == 2);
    assert(fixtures::list_dir(dir).size() == 2);

    // Already gone is fine.
    QUtil::remove_file(a.c_str());
    assert(temps.cleanup().empty());
    assert(temps.getPaths().empty());
    assert(fixtures::list_dir(dir).empty());
}

static void
test_destructor(std::string const& dir)
{
    {
        TempFileSet temps(dir);
        temps.create();
        temps.create();
        assert(fixtures::list_dir(dir).size() == 2);
    }
    assert(fixtures::list_dir(dir).empty());
}

static void
test_bad_directory(std::string const& dir)
{
    TempFileSet temps(dir + "/no-such-directory");
    try {
        temps.create();
        assert(false);
    } catch (std::runtime_error&) {
        std::cout << "create failed as expected" << std::endl;
    }
    assert(temps.getPaths().empty());
}

int
main()
{
    try {
        auto dir = fixtures::make_temp_dir();
        test_cleanup(dir);
        test_destructor(dir);
        test_bad_directory(dir);
        fixtures::remove_tree(dir);
    } catch (std::exception& e) {
        std::cout << "unexpected exception: " << e.what() << std::endl;
        return 2;
    }
    std::cout << "done" << std::endl;
    return 0;
}
