#include "gtest/gtest.h"
#include "deny_file_sanitizer.h"
#include "file_utils.h"
#include "logger.h"
#include "test_utils.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <streambuf>
#include <string>

namespace {

// Буфер, который отдает начало содержимого, а затем сообщает об ошибке ввода-вывода
class FailingStreamBuf : public std::streambuf {
public:
    explicit FailingStreamBuf(std::string prefix) : prefix_(std::move(prefix)) {
        setg(&prefix_[0], &prefix_[0], &prefix_[0] + prefix_.size());
    }

protected:
    int_type underflow() override {
        throw std::ios_base::failure("simulated read error");
    }

private:
    std::string prefix_;
};

class FailingInputStream : public std::istream {
public:
    explicit FailingInputStream(std::string prefix) : std::istream(nullptr), buf_(std::move(prefix)) {
        rdbuf(&buf_);
    }

private:
    FailingStreamBuf buf_;
};

} // namespace

class DenyFileSanitizerTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir_;
    std::filesystem::path scratch_dir_;

    static void SetUpTestSuite() {
        Logger::init(LogLevel::NONE, "", false);
    }

    void SetUp() override {
        test_dir_ = make_unique_test_dir("undeny_sanitizer_test_");
        scratch_dir_ = test_dir_ / "scratch";
        std::filesystem::create_directories(scratch_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    SanitizerOptions options() const {
        SanitizerOptions opts;
        opts.scratch_dir = scratch_dir_.string();
        return opts;
    }

    std::filesystem::path makeTarget(const std::string& name, const std::string& content) const {
        const auto path = test_dir_ / name;
        write_file_bytes(path, content);
        return path;
    }
};

TEST_F(DenyFileSanitizerTest, RemovesMatchingLinesAndKeepsBackup) {
    const std::string original = "ALL: 1.2.3.4\nALL: 5.6.7.8\nsshd: 1.2.3.4\n";
    const auto target = makeTarget("hosts.deny", original);

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    ASSERT_TRUE(result.success) << result.user_message << " " << result.error_details;
    EXPECT_EQ(result.error, FileError::None);
    EXPECT_EQ(result.lines_read, 3u);
    EXPECT_EQ(result.lines_removed, 2u);
    EXPECT_EQ(read_file_bytes(target), "ALL: 5.6.7.8\n");

    const std::filesystem::path backup = target.string() + "_orig";
    ASSERT_TRUE(std::filesystem::exists(backup));
    EXPECT_EQ(read_file_bytes(backup), original);
    EXPECT_EQ(count_entries(scratch_dir_), 0u) << "Временный файл должен быть удален";
}

TEST_F(DenyFileSanitizerTest, BlockedEntriesExample) {
    const std::string original = "1.2.3.4 blocked\n5.6.7.8 blocked\n1.2.3.4 again\n";
    const auto target = makeTarget("hosts.deny", original);

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(read_file_bytes(target), "5.6.7.8 blocked\n");
    EXPECT_EQ(read_file_bytes(target.string() + "_orig"), original);
}

TEST_F(DenyFileSanitizerTest, NoMatch_ContentUnchangedBackupWritten) {
    const std::string original = "ALL: 10.0.0.1\n# комментарий\n\nALL: 10.0.0.2\n";
    const auto target = makeTarget("hosts", original);

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "192.168.1.1");

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines_read, 4u);
    EXPECT_EQ(result.lines_removed, 0u);
    EXPECT_EQ(read_file_bytes(target), original);
    EXPECT_EQ(read_file_bytes(target.string() + "_orig"), original);
}

TEST_F(DenyFileSanitizerTest, SecondRunIsIdempotent) {
    const auto target = makeTarget("hosts-root", "1.2.3.4:1\n9.9.9.9:2\n");

    DenyFileSanitizer sanitizer(options());
    ASSERT_TRUE(sanitizer.removeMatchingLines(target.string(), "1.2.3.4").success);
    const std::string after_first = read_file_bytes(target);

    SanitizeResult second = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");
    ASSERT_TRUE(second.success);
    EXPECT_EQ(second.lines_removed, 0u);
    EXPECT_EQ(read_file_bytes(target), after_first);
    // Резервная копия перезаписывается: теперь это состояние после первого запуска
    EXPECT_EQ(read_file_bytes(target.string() + "_orig"), after_first);
}

TEST_F(DenyFileSanitizerTest, KeepsOrderOfRemainingLines) {
    const auto target = makeTarget("users-hosts",
        "a 8.8.8.8\nb 1.2.3.4\nc 7.7.7.7\nd 1.2.3.4 x\ne 6.6.6.6\n");

    DenyFileSanitizer sanitizer(options());
    ASSERT_TRUE(sanitizer.removeMatchingLines(target.string(), "1.2.3.4").success);

    auto lines = read_file_lines(target);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a 8.8.8.8");
    EXPECT_EQ(lines[1], "c 7.7.7.7");
    EXPECT_EQ(lines[2], "e 6.6.6.6");
}

TEST_F(DenyFileSanitizerTest, SubstringMatchAlsoRemovesLongerAddresses) {
    const auto target = makeTarget("hosts-valid", "11.2.3.45\n1.2.3.4\n2.2.2.2\n");

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines_removed, 2u);
    EXPECT_EQ(read_file_bytes(target), "2.2.2.2\n");
}

TEST_F(DenyFileSanitizerTest, DotIsLiteral) {
    const auto target = makeTarget("hosts", "1x2x3x4\n1.2.3.4\n");

    DenyFileSanitizer sanitizer(options());
    ASSERT_TRUE(sanitizer.removeMatchingLines(target.string(), "1.2.3.4").success);
    EXPECT_EQ(read_file_bytes(target), "1x2x3x4\n");
}

TEST_F(DenyFileSanitizerTest, PreservesLineTerminators) {
    const auto crlf = makeTarget("crlf", "keep 5.5.5.5\r\ndrop 1.2.3.4\r\nkeep 6.6.6.6\r\n");
    const auto no_trailing = makeTarget("no_trailing", "drop 1.2.3.4\nkeep 5.5.5.5");

    DenyFileSanitizer sanitizer(options());
    ASSERT_TRUE(sanitizer.removeMatchingLines(crlf.string(), "1.2.3.4").success);
    ASSERT_TRUE(sanitizer.removeMatchingLines(no_trailing.string(), "1.2.3.4").success);

    EXPECT_EQ(read_file_bytes(crlf), "keep 5.5.5.5\r\nkeep 6.6.6.6\r\n");
    EXPECT_EQ(read_file_bytes(no_trailing), "keep 5.5.5.5");
}

TEST_F(DenyFileSanitizerTest, EmptyFile) {
    const auto target = makeTarget("users-invalid", "");

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines_read, 0u);
    EXPECT_EQ(read_file_bytes(target), "");
    EXPECT_TRUE(std::filesystem::exists(target.string() + "_orig"));
}

TEST_F(DenyFileSanitizerTest, EveryLineMatches_LeavesEmptyFile) {
    const auto target = makeTarget("hosts-restricted", "1.2.3.4\nALL: 1.2.3.4\n");

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines_removed, 2u);
    EXPECT_EQ(read_file_bytes(target), "");
}

TEST_F(DenyFileSanitizerTest, MissingFile_OpenFailedWithoutBackup) {
    const auto target = test_dir_ / "does_not_exist";

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FileError::OpenFailed);
    EXPECT_FALSE(result.user_message.empty());
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(target.string() + "_orig"));
    EXPECT_EQ(count_entries(scratch_dir_), 0u);
}

TEST_F(DenyFileSanitizerTest, DirectoryTarget_OpenFailed) {
    const auto dir_target = test_dir_ / "a_directory";
    std::filesystem::create_directories(dir_target);

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(dir_target.string(), "1.2.3.4");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FileError::OpenFailed);
    EXPECT_FALSE(std::filesystem::exists(dir_target.string() + "_orig"));
}

TEST_F(DenyFileSanitizerTest, SourceNotOpened_OpenFailedWithoutStaleErrno) {
    const std::string original = "ALL: 1.2.3.4\n";
    const auto target = makeTarget("hosts.deny", original);

    DenyFileSanitizer sanitizer(options(), [](const std::filesystem::path&) -> std::unique_ptr<std::istream> {
        errno = 0;
        return nullptr;
    });
    errno = ENOENT;
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FileError::OpenFailed);
    EXPECT_EQ(result.error_details.find(std::strerror(ENOENT)), std::string::npos) << result.error_details;
    EXPECT_NE(result.error_details.find("источник не открыт"), std::string::npos) << result.error_details;
    EXPECT_EQ(read_file_bytes(target), original);
    EXPECT_FALSE(std::filesystem::exists(target.string() + "_orig"));
}

TEST_F(DenyFileSanitizerTest, ReadError_TargetUntouchedAndScratchRemoved) {
    const std::string original = "ALL: 1.2.3.4\nALL: 5.6.7.8\n";
    const auto target = makeTarget("hosts.deny", original);

    DenyFileSanitizer sanitizer(options(), [](const std::filesystem::path&) -> std::unique_ptr<std::istream> {
        return std::make_unique<FailingInputStream>("ALL: 1.2.3.4\n");
    });
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FileError::ReadFailed);
    EXPECT_EQ(read_file_bytes(target), original);
    EXPECT_FALSE(std::filesystem::exists(target.string() + "_orig"));
    EXPECT_EQ(count_entries(scratch_dir_), 0u);
}

TEST_F(DenyFileSanitizerTest, MissingScratchDirectory_ScratchFailed) {
    const std::string original = "ALL: 1.2.3.4\n";
    const auto target = makeTarget("hosts.deny", original);

    SanitizerOptions opts = options();
    opts.scratch_dir = (test_dir_ / "no_such_dir").string();
    DenyFileSanitizer sanitizer(opts);
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "1.2.3.4");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, FileError::ScratchFailed);
    EXPECT_EQ(read_file_bytes(target), original);
    EXPECT_FALSE(std::filesystem::exists(target.string() + "_orig"));
}

TEST_F(DenyFileSanitizerTest, RestoresConfiguredMode) {
    const auto target = makeTarget("hosts", "ALL: 1.2.3.4\nALL: 2.2.2.2\n");
    std::filesystem::permissions(target, static_cast<std::filesystem::perms>(0600), std::filesystem::perm_options::replace);

    DenyFileSanitizer sanitizer(options());
    ASSERT_TRUE(sanitizer.removeMatchingLines(target.string(), "1.2.3.4").success);

    auto mode = FileUtils::permissionBits(target);
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, 0644u);
}

TEST_F(DenyFileSanitizerTest, CustomSuffixAndMode) {
    const auto target = makeTarget("hosts", "x 1.2.3.4\ny 3.3.3.3\n");

    SanitizerOptions opts = options();
    opts.backup_suffix = ".bak";
    opts.target_mode = 0640;
    DenyFileSanitizer sanitizer(opts);
    EXPECT_EQ(sanitizer.backupPathFor(target.string()), target.string() + ".bak");

    ASSERT_TRUE(sanitizer.removeMatchingLines(target.string(), "1.2.3.4").success);
    EXPECT_TRUE(std::filesystem::exists(target.string() + ".bak"));
    EXPECT_FALSE(std::filesystem::exists(target.string() + "_orig"));

    auto mode = FileUtils::permissionBits(target);
    ASSERT_TRUE(mode.has_value());
    EXPECT_EQ(*mode, 0640u);
}

TEST_F(DenyFileSanitizerTest, EmptyNeedleRemovesNothing) {
    const std::string original = "a\nb\n";
    const auto target = makeTarget("hosts", original);

    DenyFileSanitizer sanitizer(options());
    SanitizeResult result = sanitizer.removeMatchingLines(target.string(), "");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.lines_removed, 0u);
    EXPECT_EQ(read_file_bytes(target), original);
}

TEST(DenyFileSanitizerFilterTest, FilterLinesOnStreams) {
    std::istringstream in("one 1.2.3.4\ntwo\nthree 1.2.3.4\nfour");
    std::ostringstream out;

    FilterStats stats = DenyFileSanitizer::filterLines(in, out, "1.2.3.4");
    EXPECT_EQ(stats.lines_read, 4u);
    EXPECT_EQ(stats.lines_removed, 2u);
    EXPECT_FALSE(stats.read_failed);
    EXPECT_FALSE(stats.write_failed);
    EXPECT_EQ(out.str(), "two\nfour");
}

TEST(DenyFileSanitizerFilterTest, LineMatches) {
    EXPECT_TRUE(DenyFileSanitizer::lineMatches("sshd: 1.2.3.4", "1.2.3.4"));
    EXPECT_TRUE(DenyFileSanitizer::lineMatches("1.2.3.45", "1.2.3.4"));
    EXPECT_FALSE(DenyFileSanitizer::lineMatches("1.2.3.5", "1.2.3.4"));
    EXPECT_FALSE(DenyFileSanitizer::lineMatches("anything", ""));
}

TEST(DenyFileSanitizerFilterTest, FileErrorToString) {
    EXPECT_EQ(fileErrorToString(FileError::None), "None");
    EXPECT_EQ(fileErrorToString(FileError::OpenFailed), "OpenFailed");
    EXPECT_EQ(fileErrorToString(FileError::ReadFailed), "ReadFailed");
    EXPECT_EQ(fileErrorToString(FileError::PermissionsFailed), "PermissionsFailed");
}
