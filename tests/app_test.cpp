// ============================================================
// app_test.cpp -- Run-level behaviour: manifest handling,
//   sample descriptor, exit codes
// ============================================================

#include "test_support.hpp"
#include "app/seqferry_app.hpp"
#include <csignal>

static const char* MANIFEST_HEADER = "id\tchecksum\tsize\turls\tsample\n";

// Uploader stand-in script that records its arguments, one per line
static std::string make_stub(const TempDir& dir, int exit_code) {
    std::string path = dir / "stub-gsutil";
    write_file(path,
               "#!/bin/sh\n"
               "for a in \"$@\"; do echo \"$a\" >> \"" + (dir / "args.log") + "\"; done\n"
               "echo 'stub uploader output' >&2\n"
               "exit " + std::to_string(exit_code) + "\n");
    fs::permissions(path, fs::perms::owner_all);
    return path;
}

static std::vector<std::string> logged_args(const TempDir& dir) {
    std::vector<std::string> out;
    std::istringstream in(read_file(dir / "args.log"));
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static AppOptions base_options(const TempDir& dir) {
    AppOptions o;
    o.manifest_path = dir / "manifest.tsv";
    o.directory = dir / "work";
    o.bucket = "bkt/";
    o.run_name = "run1";
    return o;
}

class RecordingUploader : public Uploader {
public:
    bool fail{false};
    std::vector<std::pair<std::string, std::string>> puts;

    UploadResult put(const std::string& local, const std::string& dest, bool) override {
        puts.push_back({local, dest});
        UploadResult r;
        r.ok = !fail;
        if (fail) r.diagnostic = "exit code 1";
        return r;
    }
};

static MemberRecord file_member(const std::string& name) {
    return MemberRecord{name, 10, false};
}

bool test_missing_manifest() {
    std::cout << "Testing missing manifest..." << std::endl;
    TempDir dir;
    AppOptions o = base_options(dir);
    o.uploader = make_stub(dir, 0);
    SeqferryApp app(o);
    TEST_ASSERT(app.run() == EXIT_CODE_USAGE, "missing manifest exits 1");
    TEST_ASSERT(!fs::exists(dir / "args.log"), "nothing uploaded");
    return true;
}

bool test_run_completes_with_entry_failures() {
    std::cout << "Testing run with per-entry failures..." << std::endl;
    TempDir dir;
    write_file(dir / "manifest.tsv", std::string(MANIFEST_HEADER) +
               "F1\td41d8cd98f00b204e9800998ecf8427e\t0\tgopher://old.example.org/a.tar\tS1\n");
    AppOptions o = base_options(dir);
    o.uploader = make_stub(dir, 0);

    SeqferryApp app(o);
    TEST_ASSERT(app.run() == EXIT_CODE_OK, "per-entry failures still exit 0");

    std::string run_dir = dir / "work/run1";
    std::string descriptor = run_dir + "/sample-run1.txt";
    TEST_ASSERT(file_io::exists(descriptor), "descriptor written under the run directory");
    TEST_ASSERT(read_file(descriptor).empty(), "no complete sample, empty descriptor");

    std::vector<std::string> want{"cp", descriptor, "gs://bkt/run1/"};
    TEST_ASSERT(logged_args(dir) == want, "descriptor uploaded to <bucket>/<run>/");

    std::string failures = read_file(run_dir + "/transfer_errors.log");
    TEST_ASSERT(failures.find("F1") != std::string::npos, "entry failure in the failure log");
    return true;
}

bool test_descriptor_upload_failure() {
    std::cout << "Testing descriptor upload failure..." << std::endl;
    TempDir dir;
    write_file(dir / "manifest.tsv", MANIFEST_HEADER);
    AppOptions o = base_options(dir);
    o.uploader = make_stub(dir, 1);

    SeqferryApp app(o);
    TEST_ASSERT(app.run() == EXIT_CODE_USAGE, "failed descriptor upload exits 1");
    TEST_ASSERT(logged_args(dir).size() == 3, "upload was attempted");
    return true;
}

bool test_descriptor_write_failure() {
    std::cout << "Testing descriptor write failure..." << std::endl;
    TempDir dir;
    write_file(dir / "manifest.tsv", MANIFEST_HEADER);
    // A directory where the descriptor file should go
    fs::create_directories(dir.path() / "work/run1/sample-run1.txt");
    AppOptions o = base_options(dir);
    o.uploader = make_stub(dir, 0);

    SeqferryApp app(o);
    TEST_ASSERT(app.run() == EXIT_CODE_USAGE, "unwritable descriptor exits 1");
    TEST_ASSERT(!fs::exists(dir / "args.log"), "nothing uploaded");
    return true;
}

bool test_publish_descriptor_groups_and_tallies() {
    std::cout << "Testing descriptor contents and incomplete groups..." << std::endl;
    TempDir dir;
    AppOptions o = base_options(dir);
    SeqferryApp app(o);

    RunResult result;
    result.reports.resize(2);
    result.groups.push_back({"good.tar", {MemberRecord{"S1", 0, true},
                                          file_member("S1/S1_L001_R1_001.fastq.gz"),
                                          file_member("S1/S1_L001_R2_001.fastq.gz"),
                                          file_member("S1/S1_L001_I1_001.fastq.gz")}});
    result.groups.push_back({"short.tar", {file_member("S2_L001_R1_001.fastq.gz"),
                                           file_member("S2_L001_R2_001.fastq.gz")}});

    RecordingUploader up;
    std::string run_dir = dir / "work/run1";
    TEST_ASSERT(app.publish_descriptor(result, run_dir, up) == EXIT_CODE_OK, "exit 0");
    TEST_ASSERT(result.tally.count(FailureKind::INCOMPLETE_SAMPLE_GROUP) == 1,
                "incomplete group tallied");

    std::string descriptor = run_dir + "/sample-run1.txt";
    TEST_ASSERT(read_file(descriptor) ==
                "S1/S1_L001\tS1/S1_L001_R1_001.fastq.gz\tS1/S1_L001_R2_001.fastq.gz\t"
                "S1/S1_L001_I1_001.fastq.gz\n", "one line per complete sample");
    TEST_ASSERT(up.puts.size() == 1 && up.puts[0].first == descriptor &&
                up.puts[0].second == "bkt/run1/", "descriptor handed to the uploader");

    up.fail = true;
    RunResult again;
    TEST_ASSERT(app.publish_descriptor(again, run_dir, up) == EXIT_CODE_USAGE,
                "upload failure exits 1");
    return true;
}

bool test_stop_signals_scoped_to_app() {
    std::cout << "Testing stop signal routing..." << std::endl;
    TempDir dir;
    SeqferryApp app(base_options(dir));
    TEST_ASSERT(StopSignalScope::active() == nullptr, "no app before the scope");

    bool unwound = false;
    try {
        StopSignalScope signals(app);
        TEST_ASSERT(StopSignalScope::active() == &app, "app registered");
        std::raise(SIGTERM);
        TEST_ASSERT(app.stopping(), "SIGTERM stops the app");
        throw std::runtime_error("run failed");
    } catch (const std::runtime_error&) {
        unwound = true;
    }
    TEST_ASSERT(unwound, "exception propagated");
    TEST_ASSERT(StopSignalScope::active() == nullptr, "app forgotten after unwinding");
    return true;
}

int main() {
    Logger::get().set_level(LogLevel::ERR);

    bool ok = true;
    ok &= test_missing_manifest();
    ok &= test_run_completes_with_entry_failures();
    ok &= test_descriptor_upload_failure();
    ok &= test_descriptor_write_failure();
    ok &= test_publish_descriptor_groups_and_tallies();
    ok &= test_stop_signals_scoped_to_app();

    if (!ok || tests_failed > 0) {
        std::cerr << tests_failed << " app test(s) FAILED" << std::endl;
        return 1;
    }
    std::cout << "All app tests PASSED" << std::endl;
    return 0;
}
