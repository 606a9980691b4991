#include <unistd.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>

#include "gtest/gtest.h"

#include <base.hpp>

#include "command.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

namespace {

enum class output_fault {
    NONE,
    SHORT_WRITE,
    CLOSE,
};

// 记录打开了哪些流，标准流用内存代替
class recording_handler : public fs_handler {
public:
    std::error_code open_input(const input_source &src, stream_ptr &strm) override {
        ++input_opens;
        if (std::holds_alternative<stdin_tag>(src) && stdin_data) {
            strm = std::make_unique<byte_stream>(*stdin_data);
            return {};
        }
        return fs_handler::open_input(src, strm);
    }

    std::error_code open_output(const output_destination &dst, stream_ptr &strm) override {
        ++output_opens;
        if (std::holds_alternative<stdout_tag>(dst) && stdout_sink) {
            strm = std::make_unique<capture_stream>(*stdout_sink);
            return {};
        }
        // 先创建真实文件，再换成会出错的流
        if (auto ec = fs_handler::open_output(dst, strm))
            return ec;
        switch (fault) {
        case output_fault::SHORT_WRITE:
            strm = std::make_unique<short_write_stream>();
            break;
        case output_fault::CLOSE:
            strm = std::make_unique<failing_close_stream>();
            break;
        case output_fault::NONE:
            break;
        }
        return {};
    }

    int input_opens = 0;
    int output_opens = 0;
    std::optional<std::string> stdin_data;
    std::string *stdout_sink = nullptr;
    output_fault fault = output_fault::NONE;
};

}  // namespace

// 每个用例使用独立的临时目录
class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        no_logging();
        dir = fs::temp_directory_path() /
              ("zpump_test_" + std::to_string(getpid()) + "_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    std::string path(const char *name) const {
        return (dir / name).string();
    }

    cmd_context ctx() {
        return cmd_context{ reg, files, false, reporter };
    }

    failure compress(const std::string &in, const std::string &algorithm,
                     std::optional<std::string> out = std::nullopt, bool force = false) {
        compress_opts opts;
        opts.input = file_path{ in };
        opts.algorithm = algorithm;
        if (out)
            opts.output = file_path{ *out };
        opts.force = force;
        return run_compress(opts, ctx());
    }

    failure decompress(const std::string &in, const std::string &algorithm = {},
                       std::optional<std::string> out = std::nullopt) {
        decompress_opts opts;
        opts.input = file_path{ in };
        opts.algorithm = algorithm;
        if (out)
            opts.output = file_path{ *out };
        return run_decompress(opts, ctx());
    }

    fs::path dir;
    registry reg = default_registry();
    recording_handler files;
    progress_reporter *reporter = nullptr;
};

TEST_F(CommandTest, EmptyFileLz4RoundTrip) {
    write_file(path("empty"), "");
    failure f = compress(path("empty"), "lz4");
    ASSERT_FALSE(f) << f.message();
    ASSERT_TRUE(fs::exists(path("empty.lz4")));

    fs::remove(path("empty"));
    f = decompress(path("empty.lz4"));
    ASSERT_FALSE(f) << f.message();
    ASSERT_TRUE(fs::exists(path("empty")));
    EXPECT_EQ(fs::file_size(path("empty")), 0u);
}

TEST_F(CommandTest, DefaultPathsAndCollisionSuffix) {
    std::string data = make_payload(200000);
    write_file(path("data.txt"), data);

    ASSERT_FALSE(compress(path("data.txt"), "GZIP"));
    ASSERT_TRUE(fs::exists(path("data.txt.gzip")));

    // 原文件还在，解压到.out
    failure f = decompress(path("data.txt.gzip"));
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(read_file(path("data.txt.out")), data);
    EXPECT_EQ(read_file(path("data.txt")), data);
}

TEST_F(CommandTest, PresetChoosesAlgorithm) {
    write_file(path("data.txt"), make_payload(1000));
    compress_opts opts;
    opts.input = file_path{ path("data.txt") };
    opts.level = FAST;
    opts.progress = true;
    ASSERT_FALSE(run_compress(opts, ctx()));
    EXPECT_TRUE(fs::exists(path("data.txt.lz4")));

    opts.level = BEST;
    ASSERT_FALSE(run_compress(opts, ctx()));
    EXPECT_TRUE(fs::exists(path("data.txt.xz")));
}

TEST_F(CommandTest, ExistingOutputIsNotTouched) {
    write_file(path("in"), "payload");
    write_file(path("in.gzip"), "original");

    failure f = compress(path("in"), "gzip");
    EXPECT_TRUE(f.is(zerr::output_exists));
    EXPECT_EQ(f.subject, path("in.gzip"));
    EXPECT_EQ(read_file(path("in.gzip")), "original");
    EXPECT_EQ(files.output_opens, 0);

    f = compress(path("in"), "gzip", std::nullopt, true);
    ASSERT_FALSE(f) << f.message();
    EXPECT_NE(read_file(path("in.gzip")), "original");
}

TEST_F(CommandTest, StdinNeedsExplicitAlgorithm) {
    decompress_opts opts;
    opts.input = stdin_tag{};
    opts.output = stdout_tag{};
    failure f = run_decompress(opts, ctx());
    EXPECT_TRUE(f.is(zerr::algorithm_not_inferable));
    EXPECT_EQ(origin_of(f.code), err_origin::USAGE);
    EXPECT_EQ(files.input_opens, 0);
    EXPECT_EQ(files.output_opens, 0);
}

TEST_F(CommandTest, StdinNeedsExplicitOutput) {
    compress_opts copts;
    copts.input = stdin_tag{};
    copts.algorithm = "gzip";
    EXPECT_TRUE(run_compress(copts, ctx()).is(zerr::output_required));

    decompress_opts dopts;
    dopts.input = stdin_tag{};
    dopts.algorithm = "gzip";
    EXPECT_TRUE(run_decompress(dopts, ctx()).is(zerr::output_required));
    EXPECT_EQ(files.input_opens, 0);
}

TEST_F(CommandTest, WrongAlgorithmRemovesPartialOutput) {
    write_file(path("data"), make_payload(50000));
    ASSERT_FALSE(compress(path("data"), "lz4"));

    failure f = decompress(path("data.lz4"), "gzip", path("restored"));
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_EQ(f.subject, "gzip");
    EXPECT_FALSE(fs::exists(path("restored")));
}

TEST_F(CommandTest, FailureMidStreamRemovesOutput) {
    codec_counters cnt;
    reg.add("copy", UNKNOWN, copy_entry(cnt, 3).factory);
    write_file(path("data"), make_payload(10000));

    compress_opts opts;
    opts.input = file_path{ path("data") };
    opts.algorithm = "copy";
    opts.buffer_size = 1024;
    failure f = run_compress(opts, ctx());
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_EQ(cnt.destroyed, 1);
    EXPECT_EQ(files.output_opens, 1);
    EXPECT_FALSE(fs::exists(path("data.copy")));
}

TEST_F(CommandTest, UnexpectedErrorIsWrapped) {
    reg.add("throws", UNKNOWN, [](codec_mode, level_t, std::string &) -> codec_ptr {
        throw std::runtime_error("boom");
    });
    write_file(path("data"), "abc");

    failure f = compress(path("data"), "throws");
    EXPECT_TRUE(f.is(zerr::command_failed));
    EXPECT_EQ(f.command, "compress");
    EXPECT_EQ(f.reason, "boom");
    EXPECT_EQ(origin_of(f.code), err_origin::UNEXPECTED);
    EXPECT_FALSE(fs::exists(path("data.throws")));
}

TEST_F(CommandTest, ExplicitAlgorithmWinsOverExtension) {
    std::string data = make_payload(3000);
    write_file(path("data"), data);
    ASSERT_FALSE(compress(path("data"), "gzip", path("payload.lz4")));

    failure f = decompress(path("payload.lz4"), "gzip");
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(read_file(path("payload.lz4.out")), data);
}

TEST_F(CommandTest, DecompressCreatesDirectory) {
    std::string data = make_payload(3000);
    write_file(path("data"), data);
    ASSERT_FALSE(compress(path("data"), "bzip2"));

    failure f = decompress(path("data.bzip2"), {}, path("sub/deeper/data"));
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(read_file(path("sub/deeper/data")), data);
}

TEST_F(CommandTest, CompressRequiresExistingDirectory) {
    write_file(path("data"), "abc");
    failure f = compress(path("data"), "gzip", path("missing/data.gz"));
    EXPECT_TRUE(f.is(zerr::directory_not_writable));
    EXPECT_FALSE(fs::exists(path("missing")));
}

TEST_F(CommandTest, InputValidation) {
    EXPECT_TRUE(compress(path("nope"), "gzip").is(zerr::file_not_found));
    EXPECT_TRUE(compress("", "gzip").is(zerr::invalid_input_path));
    EXPECT_TRUE(compress("../outside", "gzip").is(zerr::path_traversal));

    write_file(path("data"), "abc");
    EXPECT_TRUE(compress(path("data"), "gzip", path("data")).is(zerr::input_output_same));
    EXPECT_TRUE(compress(path("data"), "gzip", "../out").is(zerr::path_traversal));
}

TEST_F(CommandTest, AlgorithmResolution) {
    write_file(path("data.bin"), "abc");
    failure f = compress(path("data.bin"), "lzfse");
    EXPECT_TRUE(f.is(zerr::unknown_algorithm));
    EXPECT_NE(f.reason.find("bzip2, gzip, lz4"), std::string::npos);

    f = decompress(path("data.bin"));
    EXPECT_TRUE(f.is(zerr::algorithm_not_inferable));
    EXPECT_EQ(f.subject, path("data.bin"));
    EXPECT_EQ(files.input_opens, 0);
}

TEST_F(CommandTest, BufferSizeLimit) {
    write_file(path("data"), "abc");
    compress_opts opts;
    opts.input = file_path{ path("data") };
    opts.algorithm = "gzip";
    opts.buffer_size = 65 * 1024 * 1024;
    EXPECT_TRUE(run_compress(opts, ctx()).is(zerr::invalid_buffer_size));
}

TEST_F(CommandTest, EveryAlgorithmThroughFiles) {
    std::string data = make_payload(100000);
    write_file(path("data"), data);
    for (const auto &name : reg.supported_names()) {
        std::string packed = path("data") + ("." + name);
        std::string restored = path("restored.") + name;
        ASSERT_FALSE(compress(path("data"), name)) << name;
        failure f = decompress(packed, {}, restored);
        ASSERT_FALSE(f) << name << ": " << f.message();
        EXPECT_EQ(read_file(restored), data) << name;
    }
}

TEST_F(CommandTest, DecompressFailureRemovesCreatedDirectories) {
    write_file(path("data"), make_payload(50000));
    ASSERT_FALSE(compress(path("data"), "lz4"));
    fs::create_directories(path("kept"));

    failure f = decompress(path("data.lz4"), "gzip", path("sub/deeper/restored"));
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_FALSE(fs::exists(path("sub")));

    f = decompress(path("data.lz4"), "gzip", path("kept/new/restored"));
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_FALSE(fs::exists(path("kept/new")));
    EXPECT_TRUE(fs::exists(path("kept")));
}

TEST_F(CommandTest, DirectoriesNotCreatedBeforeInputOpens) {
    // 输入无法打开时不应留下新目录
    decompress_opts opts;
    opts.input = file_path{ path("missing.gzip") };
    opts.output = file_path{ path("sub/out") };
    EXPECT_TRUE(run_decompress(opts, ctx()).is(zerr::file_not_found));
    EXPECT_FALSE(fs::exists(path("sub")));
}

TEST_F(CommandTest, ReporterCompletesAfterSuccess) {
    std::string data = make_payload(200000);
    write_file(path("data"), data);
    recording_reporter rec;
    reporter = &rec;

    failure f = compress(path("data"), "gzip");
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(rec.completes, 1);
    EXPECT_EQ(rec.desc, "Compressing " + path("data"));
    ASSERT_FALSE(rec.updates.empty());
    EXPECT_EQ(rec.updates.back().first, data.size());
    EXPECT_EQ(rec.updates.back().second, data.size());
    for (size_t i = 1; i < rec.updates.size(); ++i)
        EXPECT_GT(rec.updates[i].first, rec.updates[i - 1].first);
}

TEST_F(CommandTest, ReporterCompletesAfterCodecFailure) {
    write_file(path("data"), make_payload(50000));
    ASSERT_FALSE(compress(path("data"), "lz4"));

    recording_reporter rec;
    reporter = &rec;
    failure f = decompress(path("data.lz4"), "gzip", path("restored"));
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_EQ(rec.completes, 1);
}

TEST_F(CommandTest, ShortWriteRemovesOutput) {
    write_file(path("data"), make_payload(10000));
    files.fault = output_fault::SHORT_WRITE;

    failure f = compress(path("data"), "gzip");
    EXPECT_TRUE(f.is(zerr::stream_write_failed)) << f.message();
    EXPECT_EQ(f.subject, path("data.gzip"));
    EXPECT_EQ(files.output_opens, 1);
    EXPECT_FALSE(fs::exists(path("data.gzip")));
}

TEST_F(CommandTest, FailedCloseRemovesOutput) {
    write_file(path("data"), make_payload(10000));
    files.fault = output_fault::CLOSE;
    recording_reporter rec;
    reporter = &rec;

    failure f = compress(path("data"), "bzip2");
    EXPECT_TRUE(f.is(zerr::stream_write_failed)) << f.message();
    EXPECT_EQ(f.subject, path("data.bzip2"));
    EXPECT_FALSE(fs::exists(path("data.bzip2")));
    EXPECT_EQ(rec.completes, 1);
}

TEST_F(CommandTest, StdinToStdoutRoundTrip) {
    std::string data = make_payload(100000);
    std::string packed;
    recording_reporter rec;
    reporter = &rec;

    files.stdin_data = data;
    files.stdout_sink = &packed;
    compress_opts copts;
    copts.input = stdin_tag{};
    copts.algorithm = "xz";
    copts.output = stdout_tag{};
    failure f = run_compress(copts, ctx());
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(packed.substr(0, 6), std::string("\xfd" "7zXZ\0", 6));
    // 标准输入大小未知
    ASSERT_FALSE(rec.updates.empty());
    EXPECT_EQ(rec.updates.back().first, data.size());
    EXPECT_EQ(rec.updates.back().second, 0u);

    std::string restored;
    files.stdin_data = packed;
    files.stdout_sink = &restored;
    decompress_opts dopts;
    dopts.input = stdin_tag{};
    dopts.algorithm = "xz";
    dopts.output = stdout_tag{};
    f = run_decompress(dopts, ctx());
    ASSERT_FALSE(f) << f.message();
    EXPECT_EQ(restored, data);
    EXPECT_EQ(rec.completes, 2);
}

TEST_F(CommandTest, StdoutFailureKeepsNothingToRemove) {
    write_file(path("data"), make_payload(50000));
    ASSERT_FALSE(compress(path("data"), "lz4"));

    std::string sink;
    files.stdout_sink = &sink;
    decompress_opts opts;
    opts.input = file_path{ path("data.lz4") };
    opts.algorithm = "xz";
    opts.output = stdout_tag{};
    failure f = run_decompress(opts, ctx());
    EXPECT_TRUE(f.is(zerr::codec_failed));
    EXPECT_TRUE(fs::exists(path("data.lz4")));
}
