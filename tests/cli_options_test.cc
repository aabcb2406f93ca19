#include "snapconv/cli_options.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace snapconv {
namespace {

    namespace fs = std::filesystem;

    static CliAction parse(std::initializer_list<const char*> args,
                           CliOptions* out)
    {
        std::vector<const char*> argv;
        argv.push_back("snapconv");
        argv.insert(argv.end(), args.begin(), args.end());
        return parse_cli_args(static_cast<int>(argv.size()), argv.data(), out);
    }


    // Captures one of the streams handed to run_cli_conversion.
    class CapturedStream final {
    public:
        CapturedStream()
            : f_(std::tmpfile())
        {
        }
        ~CapturedStream()
        {
            if (f_) {
                (void)std::fclose(f_);
            }
        }
        CapturedStream(const CapturedStream&)            = delete;
        CapturedStream& operator=(const CapturedStream&) = delete;

        std::FILE* get() const noexcept { return f_; }

        std::string text() const
        {
            std::string s;
            if (!f_) {
                return s;
            }
            std::fflush(f_);
            std::rewind(f_);
            char buf[256];
            size_t n = 0;
            while ((n = std::fread(buf, 1, sizeof(buf), f_)) > 0) {
                s.append(buf, n);
            }
            return s;
        }

    private:
        std::FILE* f_ = nullptr;
    };


    // <tmp>/snapconv_cli_<test>/source/PGTA1 = 00 01 FF D8 AA BB
    class CliFixture : public ::testing::Test {
    protected:
        void SetUp() override
        {
            const ::testing::TestInfo* info
                = ::testing::UnitTest::GetInstance()->current_test_info();
            base_ = fs::temp_directory_path()
                    / (std::string("snapconv_cli_") + info->name());
            std::error_code ec;
            fs::remove_all(base_, ec);
            fs::create_directories(base_ / "source");

            const char bytes[] = { 0x00, 0x01, static_cast<char>(0xFF),
                                   static_cast<char>(0xD8),
                                   static_cast<char>(0xAA),
                                   static_cast<char>(0xBB) };
            std::ofstream f(base_ / "source" / "PGTA1",
                            std::ios::binary | std::ios::trunc);
            f.write(bytes, sizeof(bytes));
        }

        void TearDown() override
        {
            std::error_code ec;
            fs::remove_all(base_, ec);
        }

        fs::path base_;
    };

}  // namespace

TEST(CliArgs, ParseU64)
{
    uint64_t v = 7U;
    EXPECT_TRUE(parse_u64_arg("0", &v));
    EXPECT_EQ(v, 0U);
    EXPECT_TRUE(parse_u64_arg("18446744073709551615", &v));
    EXPECT_EQ(v, UINT64_MAX);

    v = 7U;
    EXPECT_FALSE(parse_u64_arg("-1", &v));
    EXPECT_FALSE(parse_u64_arg("+1", &v));
    EXPECT_FALSE(parse_u64_arg(" 1", &v));
    EXPECT_FALSE(parse_u64_arg("1k", &v));
    EXPECT_FALSE(parse_u64_arg("", &v));
    EXPECT_FALSE(parse_u64_arg("18446744073709551616", &v));
    EXPECT_EQ(v, 7U);
}

TEST(CliArgs, DefaultsAndFlags)
{
    CliOptions opts;
    ASSERT_EQ(parse({}, &opts), CliAction::Convert);
    EXPECT_TRUE(opts.show_build_info);
    EXPECT_TRUE(opts.names.empty());
    EXPECT_EQ(opts.config.name_prefix, "PGTA");
    EXPECT_EQ(opts.config.extract.on_missing_marker, MissingMarkerPolicy::Fail);
    EXPECT_EQ(opts.config.src_dir, make_converter_config("").src_dir);
    EXPECT_EQ(opts.config.dst_dir, make_converter_config("").dst_dir);

    ASSERT_EQ(parse({ "--no-build-info", "--debug", "--pass-through",
                      "--base-dir", "/data", "--dst", "/out", "--prefix",
                      "SNAP", "--max-file-bytes", "100", "--max-jpeg-bytes",
                      "50", "PGTA1", "PGTA2" },
                    &opts),
              CliAction::Convert);
    EXPECT_FALSE(opts.show_build_info);
    EXPECT_TRUE(opts.config.debug);
    EXPECT_EQ(opts.config.extract.on_missing_marker,
              MissingMarkerPolicy::PassThrough);
    EXPECT_EQ(fs::path(opts.config.src_dir), fs::path("/data") / "source");
    EXPECT_EQ(opts.config.dst_dir, "/out");
    EXPECT_EQ(opts.config.name_prefix, "SNAP");
    EXPECT_EQ(opts.config.max_file_bytes, 100U);
    EXPECT_EQ(opts.config.extract.max_output_bytes, 50U);
    EXPECT_EQ(opts.names, (std::vector<std::string> { "PGTA1", "PGTA2" }));
}

TEST(CliArgs, HelpAndVersion)
{
    CliOptions opts;
    EXPECT_EQ(parse({ "--help" }, &opts), CliAction::Help);
    EXPECT_EQ(parse({ "--debug", "--version" }, &opts), CliAction::Version);
}

TEST(CliArgs, UsageErrors)
{
    CliOptions opts;
    EXPECT_EQ(parse({ "--src" }, &opts), CliAction::UsageError);
    EXPECT_EQ(opts.error, "missing value for --src");
    EXPECT_EQ(parse({ "--debug", "--max-jpeg-bytes" }, &opts),
              CliAction::UsageError);
    EXPECT_EQ(opts.error, "missing value for --max-jpeg-bytes");

    EXPECT_EQ(parse({ "--max-file-bytes", "-1" }, &opts),
              CliAction::UsageError);
    EXPECT_NE(opts.error.find("invalid --max-file-bytes value"),
              std::string::npos)
        << opts.error;

    EXPECT_EQ(parse({ "--frobnicate" }, &opts), CliAction::UsageError);
    EXPECT_EQ(opts.error, "unknown option --frobnicate");
}

TEST(CliArgs, ModeFollowsNameCount)
{
    EXPECT_EQ(convert_mode_for(0U), ConvertMode::All);
    EXPECT_EQ(convert_mode_for(1U), ConvertMode::One);
    EXPECT_EQ(convert_mode_for(2U), ConvertMode::Some);
    EXPECT_EQ(convert_mode_for(7U), ConvertMode::Some);
}

TEST_F(CliFixture, SingleNameConvertsAndExitsZero)
{
    CliOptions opts;
    ASSERT_EQ(parse({ "--base-dir", base_.c_str(), "PGTA1" }, &opts),
              CliAction::Convert);
    opts.config.log = nullptr;

    CapturedStream out;
    CapturedStream err;
    EXPECT_EQ(run_cli_conversion(opts, out.get(), err.get()), kExitOk);
    EXPECT_TRUE(err.text().empty()) << err.text();
    EXPECT_NE(out.text().find("offset=2 size=4"), std::string::npos)
        << out.text();

    std::ifstream f(base_ / "converted" / "PGTA1.jpg", std::ios::binary);
    const std::string jpeg((std::istreambuf_iterator<char>(f)),
                           std::istreambuf_iterator<char>());
    EXPECT_EQ(jpeg, std::string("\xFF\xD8\xAA\xBB"));
}

TEST_F(CliFixture, FileLimitFailsWithExitOne)
{
    CliOptions opts;
    ASSERT_EQ(parse({ "--base-dir", base_.c_str(), "--max-file-bytes", "3",
                      "PGTA1" },
                    &opts),
              CliAction::Convert);
    opts.config.log = nullptr;

    CapturedStream out;
    CapturedStream err;
    EXPECT_EQ(run_cli_conversion(opts, out.get(), err.get()), kExitFailed);
    EXPECT_NE(err.text().find("PGTA1: limit_exceeded"), std::string::npos)
        << err.text();
    EXPECT_FALSE(fs::exists(base_ / "converted" / "PGTA1.jpg"));
}

TEST_F(CliFixture, ConvertAllAndSubset)
{
    CliOptions opts;
    ASSERT_EQ(parse({ "--base-dir", base_.c_str() }, &opts),
              CliAction::Convert);
    opts.config.log = nullptr;

    CapturedStream out;
    CapturedStream err;
    EXPECT_EQ(run_cli_conversion(opts, out.get(), err.get()), kExitOk);
    EXPECT_NE(out.text().find("converted=1 failed=0"), std::string::npos)
        << out.text();

    // One requested name is absent: the batch reports it and exits 1.
    ASSERT_EQ(parse({ "--base-dir", base_.c_str(), "PGTA1", "PGTA404" },
                    &opts),
              CliAction::Convert);
    opts.config.log = nullptr;
    CapturedStream out2;
    CapturedStream err2;
    EXPECT_EQ(run_cli_conversion(opts, out2.get(), err2.get()), kExitFailed);
    EXPECT_NE(out2.text().find("converted=1 failed=1"), std::string::npos)
        << out2.text();
    EXPECT_NE(err2.text().find("PGTA404: not_found"), std::string::npos)
        << err2.text();
}

TEST_F(CliFixture, MissingSourceExitsOne)
{
    CliOptions opts;
    ASSERT_EQ(parse({ "--src", (base_ / "nope").c_str() }, &opts),
              CliAction::Convert);
    opts.config.log = nullptr;

    CapturedStream out;
    CapturedStream err;
    EXPECT_EQ(run_cli_conversion(opts, out.get(), err.get()), kExitFailed);
    EXPECT_NE(err.text().find("Source directory does not exist"),
              std::string::npos)
        << err.text();
}

}  // namespace snapconv
