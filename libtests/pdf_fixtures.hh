#ifndef PDF_FIXTURES_HH
#define PDF_FIXTURES_HH

#include <string>
#include <vector>

// Documents and scratch directories shared by the test programs.
// Every document has a single page that shows some text.

namespace fixtures
{
    // Document information /Producer (Adobe Acrobat 9.0) and
    // /Author (Jane Doe); Helvetica font
    void write_document_with_info(std::string const& filename);

    // Metadata in every place the sanitizer knows about: document
    // information, catalog XMP, page /Metadata /PieceInfo and /Tabs, a
    // /Text annotation with /T /Contents and /M, /Link and /Widget
    // annotations, catalog /JavaScript /Names /AcroForm and /Outlines,
    // and a font descriptor naming Arial
    void write_rich_document(std::string const& filename);

    // Document information with only /Title, given as UTF-8; Courier
    // font
    void write_document_with_title(std::string const& filename, std::string const& title);

    // Nothing a validator should flag
    void write_clean_document(std::string const& filename);

    // Clean except for a 4096-byte pseudo-random image
    void write_high_entropy_document(std::string const& filename);

    // Not a PDF at all
    void write_garbage(std::string const& filename);

    std::string read_file(std::string const& filename);
    void copy_file(std::string const& from, std::string const& to);

    // A new empty directory under TMPDIR or /tmp
    std::string make_temp_dir();
    // Entries of dir other than "." and "..", sorted
    std::vector<std::string> list_dir(std::string const& dir);
    // Remove dir and the regular files directly in it
    void remove_tree(std::string const& dir);
} // namespace fixtures

#endif // PDF_FIXTURES_HH
