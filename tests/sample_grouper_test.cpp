// ============================================================
// sample_grouper_test.cpp -- R1/R2/I1 grouping and descriptor
// ============================================================

#include "test_support.hpp"
#include "transfer/sample_grouper.hpp"

static ExtractedGroup make_group(const std::string& archive, const std::vector<std::string>& names) {
    ExtractedGroup g;
    g.archive = archive;
    for (auto& n : names) g.members.push_back({n, 1, false});
    return g;
}

bool test_classify() {
    std::cout << "Testing role classification..." << std::endl;
    TEST_ASSERT(grouper::classify("S_L001_R1_001.fastq.gz") == grouper::Role::R1, "R1");
    TEST_ASSERT(grouper::classify("S_L001_R2_001.fastq.gz") == grouper::Role::R2, "R2");
    TEST_ASSERT(grouper::classify("S_L001_I1_001.fastq.gz") == grouper::Role::I1, "I1");
    TEST_ASSERT(grouper::classify("S_L001_R1_001.fastq") == grouper::Role::NONE, "suffix required");
    TEST_ASSERT(grouper::classify("S_L001_R3_001.fastq.gz") == grouper::Role::NONE, "unknown role");
    TEST_ASSERT(grouper::classify("README") == grouper::Role::NONE, "other file");
    return true;
}

bool test_complete_triple() {
    std::cout << "Testing complete triple..." << std::endl;
    auto res = grouper::group({make_group("a.tar", {
        "pbmc_S1_L001_I1_001.fastq.gz",
        "pbmc_S1_L001_R2_001.fastq.gz",
        "pbmc_S1_L001_R1_001.fastq.gz",
    })});
    TEST_ASSERT(res.records.size() == 1, "exactly one record");
    TEST_ASSERT(res.incomplete.empty(), "no incomplete report");
    const auto& r = res.records[0];
    TEST_ASSERT(r.sample_id == "pbmc_S1_L001", "prefix before _R1_, got " << r.sample_id);
    TEST_ASSERT(r.r1 == "pbmc_S1_L001_R1_001.fastq.gz" && r.r2 == "pbmc_S1_L001_R2_001.fastq.gz" &&
                r.i1 == "pbmc_S1_L001_I1_001.fastq.gz", "fixed role order");
    return true;
}

bool test_missing_role() {
    std::cout << "Testing group missing I1..." << std::endl;
    auto res = grouper::group({make_group("b.tar", {
        "x_R1_001.fastq.gz",
        "x_R2_001.fastq.gz",
    })});
    TEST_ASSERT(res.records.empty(), "no complete record");
    TEST_ASSERT(res.incomplete.size() == 1, "one incomplete report");
    TEST_ASSERT(res.incomplete[0].archive == "b.tar", "report names the archive");
    TEST_ASSERT(res.incomplete[0].names == std::vector<std::string>({"x_R1_001.fastq.gz", "x_R2_001.fastq.gz"}),
                "report lists both names");
    return true;
}

bool test_duplicate_role_is_incomplete() {
    std::cout << "Testing duplicate role..." << std::endl;
    auto res = grouper::group({make_group("c.tar", {
        "a_R1_001.fastq.gz", "a_R2_001.fastq.gz", "a_I1_001.fastq.gz", "b_R1_001.fastq.gz",
    })});
    TEST_ASSERT(res.records.empty(), "duplicate R1 is not complete");
    TEST_ASSERT(res.incomplete.size() == 1 && res.incomplete[0].names.size() == 4, "all names reported");
    return true;
}

bool test_skipped_and_order() {
    std::cout << "Testing skipped names and group order..." << std::endl;
    ExtractedGroup with_dir = make_group("first.tar", {
        "s1/A_R1_x.fastq.gz", "s1/A_R2_x.fastq.gz", "s1/A_I1_x.fastq.gz", "s1/summary.csv",
    });
    with_dir.members.insert(with_dir.members.begin(), MemberRecord{"s1", 0, true});

    auto res = grouper::group({
        with_dir,
        make_group("broken.tar", {"B_R1_x.fastq.gz"}),
        make_group("third.tar", {"C_I1_y.fastq.gz", "C_R1_y.fastq.gz", "C_R2_y.fastq.gz"}),
    });
    TEST_ASSERT(res.records.size() == 2, "two complete groups");
    TEST_ASSERT(res.records[0].sample_id == "s1/A" && res.records[1].sample_id == "C", "input order kept");
    TEST_ASSERT(res.skipped == std::vector<std::string>({"s1/summary.csv"}), "non-data name skipped");
    TEST_ASSERT(res.incomplete.size() == 1 && res.incomplete[0].archive == "broken.tar", "broken group reported");
    return true;
}

bool test_write_descriptor() {
    std::cout << "Testing descriptor output..." << std::endl;
    TempDir dir;
    std::vector<SampleRecord> recs{
        {"A", "A_R1_.fastq.gz", "A_R2_.fastq.gz", "A_I1_.fastq.gz"},
        {"B", "B_R1_.fastq.gz", "B_R2_.fastq.gz", "B_I1_.fastq.gz"},
    };
    std::string path = dir / "run/sample-run.txt";
    grouper::write_descriptor(recs, path);
    TEST_ASSERT(read_file(path) ==
                "A\tA_R1_.fastq.gz\tA_R2_.fastq.gz\tA_I1_.fastq.gz\n"
                "B\tB_R1_.fastq.gz\tB_R2_.fastq.gz\tB_I1_.fastq.gz\n", "tab-delimited lines");

    grouper::write_descriptor({}, dir / "empty.txt");
    TEST_ASSERT(file_io::exists(dir / "empty.txt") && file_io::get_file_size(dir / "empty.txt") == 0,
                "no records gives an empty descriptor");

    write_file(dir / "blocker", "file");
    bool threw = false;
    try { grouper::write_descriptor(recs, dir / "blocker/sample.txt"); }
    catch (const std::exception&) { threw = true; }
    TEST_ASSERT(threw, "unwritable path throws");
    return true;
}

int main() {
    Logger::get().set_level(LogLevel::ERR);

    bool ok = true;
    ok &= test_classify();
    ok &= test_complete_triple();
    ok &= test_missing_role();
    ok &= test_duplicate_role_is_incomplete();
    ok &= test_skipped_and_order();
    ok &= test_write_descriptor();

    if (!ok || tests_failed > 0) {
        std::cerr << tests_failed << " sample grouper test(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All sample grouper tests PASSED" << std::endl;
    return 0;
}
