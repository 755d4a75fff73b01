#include "pdf_fixtures.hh"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <dirent.h>
#include <stdexcept>
#include <unistd.h>

namespace
{
    std::string const page_text = "BT /F1 24 Tf 72 320 Td (Hello) Tj ET\n";
} // namespace

// Add a page using font as /F1 and return it
static QPDFObjectHandle
add_page(QPDF& pdf, QPDFObjectHandle font)
{
    QPDFObjectHandle rfont = QPDFObjectHandle::newDictionary();
    rfont.replaceKey("/F1", font);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", rfont);

    QPDFObjectHandle page = pdf.makeIndirectObject("<<"
                                                   " /Type /Page"
                                                   " /MediaBox [0 0 612 392]"
                                                   ">>"_qpdf);
    page.replaceKey("/Contents", pdf.newStream(page_text));
    page.replaceKey("/Resources", resources);
    QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(page), false);
    return page;
}

static QPDFObjectHandle
make_font(QPDF& pdf, std::string const& base_font)
{
    auto font = pdf.makeIndirectObject("<<"
                                       " /Type /Font"
                                       " /Subtype /Type1"
                                       " /Name /F1"
                                       ">>"_qpdf);
    font.replaceKey("/BaseFont", QPDFObjectHandle::newName(base_font));
    return font;
}

static void
add_info(QPDF& pdf)
{
    auto info = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
    info.replaceKey("/Producer", QPDFObjectHandle::newUnicodeString("Adobe Acrobat 9.0"));
    info.replaceKey("/Author", QPDFObjectHandle::newUnicodeString("Jane Doe"));
    pdf.getTrailer().replaceKey("/Info", info);
}

static void
write(QPDF& pdf, std::string const& filename)
{
    QPDFWriter w(pdf, filename.c_str());
    w.setDeterministicID(true);
    w.write();
}

void
fixtures::write_document_with_info(std::string const& filename)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_page(pdf, make_font(pdf, "/Helvetica"));
    add_info(pdf);
    write(pdf, filename);
}

void
fixtures::write_rich_document(std::string const& filename)
{
    QPDF pdf;
    pdf.emptyPDF();
    auto font = make_font(pdf, "/Helvetica");
    font.replaceKey(
        "/FontDescriptor",
        pdf.makeIndirectObject("<<"
                               " /Type /FontDescriptor"
                               " /FontName /Arial"
                               " /Flags 32"
                               " /ItalicAngle 0"
                               ">>"_qpdf));
    auto page = add_page(pdf, font);
    add_info(pdf);

    std::string const xmp = "<?xpacket begin='' id='W5M0MpCehiHzreSzNTczkc9d'?>\n"
                            "<x:xmpmeta xmlns:x='adobe:ns:meta/'>\n"
                            "<dc:creator>Jane Doe</dc:creator>\n"
                            "</x:xmpmeta>\n"
                            "<?xpacket end='w'?>\n";
    auto root_xmp = pdf.newStream(xmp);
    root_xmp.getDict().replaceKey("/Type", "/Metadata"_qpdf);
    root_xmp.getDict().replaceKey("/Subtype", "/XML"_qpdf);
    auto root = pdf.getRoot();
    root.replaceKey("/Metadata", root_xmp);

    auto page_xmp = pdf.newStream(xmp);
    page_xmp.getDict().replaceKey("/Type", "/Metadata"_qpdf);
    page_xmp.getDict().replaceKey("/Subtype", "/XML"_qpdf);
    page.replaceKey("/Metadata", page_xmp);
    page.replaceKey("/PieceInfo", "<< /Illustrator << /LastModified (D:20200101) >> >>"_qpdf);
    page.replaceKey("/Tabs", "/S"_qpdf);

    auto annots = QPDFObjectHandle::newArray();
    annots.appendItem(pdf.makeIndirectObject("<<"
                                             " /Type /Annot"
                                             " /Subtype /Text"
                                             " /Rect [100 100 120 120]"
                                             " /T (Jane Doe)"
                                             " /Contents (Reviewed)"
                                             " /M (D:20200101000000Z)"
                                             ">>"_qpdf));
    annots.appendItem(pdf.makeIndirectObject("<<"
                                             " /Type /Annot"
                                             " /Subtype /Link"
                                             " /Rect [10 10 50 30]"
                                             " /Border [0 0 0]"
                                             ">>"_qpdf));
    annots.appendItem(pdf.makeIndirectObject("<<"
                                             " /Type /Annot"
                                             " /Subtype /Widget"
                                             " /Rect [200 10 300 30]"
                                             " /FT /Tx"
                                             ">>"_qpdf));
    page.replaceKey("/Annots", annots);

    root.replaceKey(
        "/JavaScript", "<< /S /JavaScript /JS (app.alert\\('hi'\\);) >>"_qpdf);
    root.replaceKey("/Names", "<< /EmbeddedFiles << /Names [] >> >>"_qpdf);
    root.replaceKey("/AcroForm", "<< /Fields [] >>"_qpdf);
    root.replaceKey("/Outlines", pdf.makeIndirectObject("<< /Type /Outlines /Count 0 >>"_qpdf));

    write(pdf, filename);
}

void
fixtures::write_document_with_title(std::string const& filename, std::string const& title)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_page(pdf, make_font(pdf, "/Courier"));
    auto info = pdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
    info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(title));
    pdf.getTrailer().replaceKey("/Info", info);
    write(pdf, filename);
}

void
fixtures::write_clean_document(std::string const& filename)
{
    QPDF pdf;
    pdf.emptyPDF();
    add_page(pdf, make_font(pdf, "/Courier"));
    write(pdf, filename);
}

void
fixtures::write_high_entropy_document(std::string const& filename)
{
    QPDF pdf;
    pdf.emptyPDF();
    auto page = add_page(pdf, make_font(pdf, "/Courier"));

    std::string data;
    unsigned long seed = 12345;
    for (int i = 0; i < 4096; ++i) {
        seed = (seed * 1103515245UL + 12345UL) & 0x7fffffffUL;
        data.append(1, static_cast<char>((seed >> 16) & 0xff));
    }
    auto image = pdf.newStream(data);
    image.replaceDict("<<"
                      " /Type /XObject"
                      " /Subtype /Image"
                      " /Width 64"
                      " /Height 64"
                      " /ColorSpace /DeviceGray"
                      " /BitsPerComponent 8"
                      ">>"_qpdf);
    auto xobject = QPDFObjectHandle::newDictionary();
    xobject.replaceKey("/Im1", image);
    page.getKey("/Resources").replaceKey("/XObject", xobject);

    write(pdf, filename);
}

void
fixtures::write_garbage(std::string const& filename)
{
    QUtil::FileCloser fc(QUtil::safe_fopen(filename.c_str(), "wb"));
    std::string const text = "this is not a PDF file\n";
    if (fwrite(text.data(), 1, text.length(), fc.f) != text.length()) {
        throw std::runtime_error("short write to " + filename);
    }
}

std::string
fixtures::read_file(std::string const& filename)
{
    std::shared_ptr<char> buf;
    size_t size = 0;
    QUtil::read_file_into_memory(filename.c_str(), buf, size);
    return std::string(buf.get(), size);
}

void
fixtures::copy_file(std::string const& from, std::string const& to)
{
    auto data = read_file(from);
    QUtil::FileCloser fc(QUtil::safe_fopen(to.c_str(), "wb"));
    if (fwrite(data.data(), 1, data.length(), fc.f) != data.length()) {
        throw std::runtime_error("short write to " + to);
    }
}

std::string
fixtures::make_temp_dir()
{
    std::string base;
    if (!(QUtil::get_env("TMPDIR", &base) && !base.empty())) {
        base = "/tmp";
    }
    std::string templ = base + "/pdfscrub-test-XXXXXX";
    if (mkdtemp(&templ[0]) == nullptr) {
        QUtil::throw_system_error("mkdtemp " + templ);
    }
    return templ;
}

std::vector<std::string>
fixtures::list_dir(std::string const& dir)
{
    std::vector<std::string> result;
    DIR* d = opendir(dir.c_str());
    if (d == nullptr) {
        QUtil::throw_system_error("opendir " + dir);
    }
    while (struct dirent* e = readdir(d)) {
        std::string name = e->d_name;
        if ((name != ".") && (name != "..")) {
            result.push_back(name);
        }
    }
    closedir(d);
    std::sort(result.begin(), result.end());
    return result;
}

void
fixtures::remove_tree(std::string const& dir)
{
    for (auto const& name: list_dir(dir)) {
        QUtil::remove_file((dir + "/" + name).c_str());
    }
    if (rmdir(dir.c_str()) != 0) {
        QUtil::throw_system_error("rmdir " + dir);
    }
}
