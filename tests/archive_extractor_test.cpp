// ============================================================
// archive_extractor_test.cpp -- tar / tar.zst extraction
// ============================================================

#include "test_support.hpp"
#include "transfer/archive_extractor.hpp"
#include <zstd.h>

static std::string zstd_compress(const std::string& raw) {
    std::string out(ZSTD_compressBound(raw.size()), '\0');
    size_t n = ZSTD_compress(&out[0], out.size(), raw.data(), raw.size(), 3);
    if (ZSTD_isError(n)) throw std::runtime_error(ZSTD_getErrorName(n));
    out.resize(n);
    return out;
}

static std::vector<std::string> names_of(const std::vector<MemberRecord>& m) {
    std::vector<std::string> out;
    for (auto& r : m) out.push_back(r.name);
    return out;
}

bool test_is_archive() {
    std::cout << "Testing archive suffix convention..." << std::endl;
    TEST_ASSERT(archive::is_archive("x.tar"), ".tar");
    TEST_ASSERT(archive::is_archive("dir/x.tar.zst"), ".tar.zst");
    TEST_ASSERT(!archive::is_archive("x.fastq.gz"), "fastq");
    TEST_ASSERT(!archive::is_archive("x.tar.partial"), "partial file");
    TEST_ASSERT(!archive::is_archive("x.tar.gz"), "gzip tar not supported");
    return true;
}

bool test_extract_tar_in_place() {
    std::cout << "Testing plain tar extraction..." << std::endl;
    TempDir dir;
    TarWriter tw;
    tw.add_dir("run1/");
    tw.add_file("run1/S1_L001_R1_001.fastq.gz", "read one");
    tw.add_file("./run1/S1_L001_R2_001.fastq.gz", "read two");
    tw.add_file("top.txt", std::string(1000, 'z'));
    tw.add_file("empty", "");
    write_file(dir / "a.tar", tw.finish());

    auto r = archive::extract(dir / "a.tar");
    TEST_ASSERT(r.ok, "extraction ok: " << r.error);
    std::vector<std::string> want{"run1", "run1/S1_L001_R1_001.fastq.gz",
                                  "run1/S1_L001_R2_001.fastq.gz", "top.txt", "empty"};
    TEST_ASSERT(names_of(r.members) == want, "member list in archive order");
    TEST_ASSERT(r.members[0].is_dir && !r.members[1].is_dir, "directory flag");
    TEST_ASSERT(r.members[3].size == 1000, "member size");
    TEST_ASSERT(read_file(dir / "run1/S1_L001_R2_001.fastq.gz") == "read two", "content next to archive");
    TEST_ASSERT(file_io::exists(dir / "empty") && file_io::get_file_size(dir / "empty") == 0, "empty member");
    TEST_ASSERT(!file_io::exists(dir / "a.tar"), "archive deleted after success");
    return true;
}

bool test_extract_tar_zst() {
    std::cout << "Testing .tar.zst extraction..." << std::endl;
    TempDir dir;
    TarWriter tw;
    std::string big = make_payload(600000, 21);
    tw.add_file("big.bin", big);
    tw.add_file("small.txt", "hello");
    write_file(dir / "b.tar.zst", zstd_compress(tw.finish()));

    auto r = archive::extract(dir / "b.tar.zst");
    TEST_ASSERT(r.ok, "zstd extraction ok: " << r.error);
    TEST_ASSERT(r.members.size() == 2, "two members");
    TEST_ASSERT(read_file(dir / "big.bin") == big, "large member content");
    TEST_ASSERT(!file_io::exists(dir / "b.tar.zst"), "archive deleted");
    TEST_ASSERT(!file_io::exists(dir / "b.tar.zst.unpacking"), "scratch tar removed");
    return true;
}

bool test_long_names() {
    std::cout << "Testing GNU and pax long names..." << std::endl;
    TempDir dir;
    std::string long_name = "deep/" + std::string(120, 'n') + "_R1_001.fastq.gz";
    std::string pax_name  = "pax/" + std::string(130, 'p') + "_I1_001.fastq.gz";
    TarWriter tw;
    tw.add_long_name_file(long_name, "gnu");
    tw.add_pax_path_file(pax_name, "pax");
    write_file(dir / "c.tar", tw.finish());

    auto r = archive::extract(dir / "c.tar");
    TEST_ASSERT(r.ok, "long name extraction ok: " << r.error);
    TEST_ASSERT(names_of(r.members) == std::vector<std::string>({long_name, pax_name}), "full names kept");
    TEST_ASSERT(read_file(dir / long_name) == "gnu" && read_file(dir / pax_name) == "pax", "contents");
    return true;
}

bool test_corrupt_archive_left_in_place() {
    std::cout << "Testing corrupt archive..." << std::endl;
    TempDir dir;
    TarWriter tw;
    tw.add_file("first.txt", "ok");
    tw.add_file("second.txt", "damaged");
    std::string tar = tw.finish();
    tar[1024 + 10] ^= 0x55;  // second header: checksum no longer matches
    write_file(dir / "d.tar", tar);

    auto r = archive::extract(dir / "d.tar");
    TEST_ASSERT(!r.ok, "corrupt header must fail");
    TEST_ASSERT(!r.error.empty(), "diagnostic present");
    TEST_ASSERT(file_io::exists(dir / "d.tar"), "archive left in place after failure");
    TEST_ASSERT(!file_io::exists(dir / "first.txt"), "partial extraction discarded");
    return true;
}

bool test_rollback_keeps_existing_files() {
    std::cout << "Testing rollback leaves pre-existing files..." << std::endl;
    TempDir dir;
    write_file(dir / "keep.txt", "already here");
    TarWriter tw;
    tw.add_file("keep.txt", "from archive");
    tw.add_file("new.txt", "fresh");
    tw.add_file("broken.txt", "x");
    std::string tar = tw.finish();
    tar[2048 + 10] ^= 0x55;  // third header fails its checksum
    write_file(dir / "k.tar", tar);

    auto r = archive::extract(dir / "k.tar");
    TEST_ASSERT(!r.ok, "corrupt third header fails");
    TEST_ASSERT(file_io::exists(dir / "keep.txt"), "file that predates extraction survives rollback");
    TEST_ASSERT(!file_io::exists(dir / "new.txt"), "file created by extraction removed");
    return true;
}

bool test_truncated_archive() {
    std::cout << "Testing truncated archive..." << std::endl;
    TempDir dir;
    TarWriter tw;
    tw.add_dir("sub/");
    tw.add_file("sub/data.bin", make_payload(5000));
    std::string tar = tw.finish();
    write_file(dir / "e.tar", tar.substr(0, 512 * 2 + 1000));

    auto r = archive::extract(dir / "e.tar");
    TEST_ASSERT(!r.ok, "truncated member must fail");
    TEST_ASSERT(file_io::exists(dir / "e.tar"), "archive kept");
    TEST_ASSERT(!file_io::exists(dir / "sub/data.bin") && !file_io::exists(dir / "sub"),
                "written file and created directory rolled back");

    // A zstd stream cut short fails the same way
    write_file(dir / "f.tar.zst", zstd_compress(tar).substr(0, 40));
    r = archive::extract(dir / "f.tar.zst");
    TEST_ASSERT(!r.ok && file_io::exists(dir / "f.tar.zst"), "truncated zstd fails, archive kept");
    return true;
}

bool test_path_traversal_rejected() {
    std::cout << "Testing path traversal..." << std::endl;
    TempDir dir;
    fs::create_directories(dir.path() / "stage");
    for (const char* evil : {"../escape.txt", "/etc/seqferry-abs.txt", "a/../../escape2.txt"}) {
        TarWriter tw;
        tw.add_file("fine.txt", "fine");
        tw.add_file(evil, "evil");
        write_file(dir / "stage/g.tar", tw.finish());

        auto r = archive::extract(dir / "stage/g.tar");
        TEST_ASSERT(!r.ok, "traversal member '" << evil << "' must fail");
        TEST_ASSERT(file_io::exists(dir / "stage/g.tar"), "archive kept");
        TEST_ASSERT(!file_io::exists(dir / "stage/fine.txt"), "earlier member rolled back");
        TEST_ASSERT(!file_io::exists(dir / "escape.txt") && !file_io::exists(dir / "escape2.txt"),
                    "nothing written outside");
    }
    return true;
}

bool test_links_skipped() {
    std::cout << "Testing link members are skipped..." << std::endl;
    TempDir dir;
    TarWriter tw;
    tw.add_file("real.txt", "data");
    tw.add_file("link.txt", "", '2');
    write_file(dir / "h.tar", tw.finish());
    auto r = archive::extract(dir / "h.tar");
    TEST_ASSERT(r.ok, "links do not fail extraction");
    TEST_ASSERT(r.members.size() == 1 && r.members[0].name == "real.txt", "link not reported");
    TEST_ASSERT(!file_io::exists(dir / "link.txt"), "link not created");
    return true;
}

bool test_scan_skips_non_archives() {
    std::cout << "Testing directory scan..." << std::endl;
    TempDir dir;
    TarWriter t1;
    t1.add_file("x_R1_.fastq.gz", "1");
    write_file(dir / "one.tar", t1.finish());
    TarWriter t2;
    t2.add_file("y.txt", "2");
    write_file(dir / "two.tar.zst", zstd_compress(t2.finish()));
    write_file(dir / "notes.txt", "not an archive");
    write_file(dir / "bad.tar", std::string(700, '1'));

    auto scan = archive::scan_and_extract(dir.path().string());
    TEST_ASSERT(scan.groups.size() == 2, "two archives extracted");
    TEST_ASSERT(scan.groups[0].archive == "one.tar" && scan.groups[1].archive == "two.tar.zst",
                "groups in name order");
    TEST_ASSERT(scan.failed.size() == 1 && fs::path(scan.failed[0].path).filename().string() == "bad.tar",
                "bad archive reported");
    bool notes_skipped = std::find(scan.skipped.begin(), scan.skipped.end(), "notes.txt") != scan.skipped.end();
    TEST_ASSERT(notes_skipped, "non-archive skipped and reported");
    TEST_ASSERT(file_io::exists(dir / "notes.txt") && file_io::exists(dir / "bad.tar"), "left alone");
    return true;
}

int main() {
    Logger::get().set_level(LogLevel::ERR);

    bool ok = true;
    ok &= test_is_archive();
    ok &= test_extract_tar_in_place();
    ok &= test_extract_tar_zst();
    ok &= test_long_names();
    ok &= test_corrupt_archive_left_in_place();
    ok &= test_rollback_keeps_existing_files();
    ok &= test_truncated_archive();
    ok &= test_path_traversal_rejected();
    ok &= test_links_skipped();
    ok &= test_scan_skips_non_archives();

    if (!ok || tests_failed > 0) {
        std::cerr << tests_failed << " archive extractor test(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All archive extractor tests PASSED" << std::endl;
    return 0;
}
