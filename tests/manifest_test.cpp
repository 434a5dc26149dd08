// ============================================================
// manifest_test.cpp -- Manifest TSV parsing
// ============================================================

#include "test_support.hpp"
#include "transfer/manifest.hpp"

bool test_parse_rows() {
    std::cout << "Testing manifest rows..." << std::endl;
    auto e = parse_manifest_text(
        "file_id\tmd5\tsize\turls\tsample_id\n"
        "f1\t900150983cd24fb0d6963f7d28e17f72\t3\thttp://h/a.tar,s3://b/a.tar\tS1\r\n"
        "\n"
        "f2\tabc\t10\ts3://b/b.tar\tS2\textra\n");
    TEST_ASSERT(e.size() == 2, "two entries");
    TEST_ASSERT(e[0].id == "f1" && e[0].size_hint == "3" && e[0].sample_id == "S1", "fields of row 1");
    TEST_ASSERT(e[0].source_urls == "http://h/a.tar,s3://b/a.tar", "URL list kept comma-joined");
    TEST_ASSERT(e[1].checksum == "abc" && e[1].sample_id == "S2", "extra columns ignored");
    return true;
}

bool test_short_and_duplicate_rows_skipped() {
    std::cout << "Testing malformed rows..." << std::endl;
    auto e = parse_manifest_text(
        "header\n"
        "f1\tmd5\t1\n"
        "f2\tmd5\t1\thttp://h/x\tS\n"
        "f2\tmd5\t1\thttp://h/y\tS\n"
        "\tmd5\t1\thttp://h/z\tS\n");
    TEST_ASSERT(e.size() == 1 && e[0].id == "f2" && e[0].source_urls == "http://h/x",
                "short, duplicate and id-less rows skipped");
    return true;
}

bool test_header_only_and_missing_file() {
    std::cout << "Testing empty manifest and missing file..." << std::endl;
    TEST_ASSERT(parse_manifest_text("id\tmd5\tsize\turls\tsample\n").empty(), "header only");
    TEST_ASSERT(parse_manifest_text("").empty(), "empty text");

    TempDir dir;
    write_file(dir / "m.tsv", "h\nf\tc\t1\thttp://h/f\ts\n");
    TEST_ASSERT(parse_manifest(dir / "m.tsv").size() == 1, "from file");

    bool threw = false;
    try { parse_manifest(dir / "missing.tsv"); } catch (const std::runtime_error&) { threw = true; }
    TEST_ASSERT(threw, "missing manifest throws");
    return true;
}

int main() {
    Logger::get().set_level(LogLevel::ERR);

    bool ok = true;
    ok &= test_parse_rows();
    ok &= test_short_and_duplicate_rows_skipped();
    ok &= test_header_only_and_missing_file();

    if (!ok || tests_failed > 0) {
        std::cerr << tests_failed << " manifest test(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All manifest tests PASSED" << std::endl;
    return 0;
}
