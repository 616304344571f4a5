#include <gtest/gtest.h>
#include <capture/fd_redirect.hpp>
#include <platform/descriptor.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

using Lines = std::vector<std::string>;

// Descriptor 1 is pointed at a temp file for each test, so the bytes the
// pump echoes to the "console" can be read back.
class FdRedirectTest : public ::testing::Test {
protected:
    int saved_stdout = -1;
    std::FILE* console_file = nullptr;
    int console_fd = -1;

    void SetUp() override {
        std::fflush(stdout);
        saved_stdout = ::dup(STDOUT_FILENO);
        console_file = std::tmpfile();
        ASSERT_NE(console_file, nullptr);
        console_fd = ::fileno(console_file);
        ASSERT_GE(::dup2(console_fd, STDOUT_FILENO), 0);
    }

    void TearDown() override {
        std::fflush(stdout);
        if (saved_stdout >= 0) {
            ::dup2(saved_stdout, STDOUT_FILENO);
            ::close(saved_stdout);
        }
        if (console_file) std::fclose(console_file);
    }

    std::string console_text() const {
        struct stat st {};
        if (::fstat(console_fd, &st) != 0) return {};
        std::string text(static_cast<std::size_t>(st.st_size), '\0');
        ssize_t n = ::pread(console_fd, &text[0], text.size(), 0);
        text.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
        return text;
    }

    bool stdout_is_console() const {
        struct stat a {}, b {};
        if (::fstat(STDOUT_FILENO, &a) != 0 || ::fstat(console_fd, &b) != 0) return false;
        return a.st_dev == b.st_dev && a.st_ino == b.st_ino;
    }

    static LineCallback collect(Lines& out) {
        return [&out](const std::string& line) { out.push_back(line); };
    }

    static std::unique_ptr<FdRedirect> make(LineCallbacks callbacks,
                                            const ConsoleSettings& settings = {}) {
        auto r = FdRedirect::create(StreamName::Stdout, std::move(callbacks), settings);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return std::move(r.value);
    }

    // The pump's end of the pipe currently behind descriptor 1, or -1.
    static int find_pipe_read_end() {
        struct stat out {};
        if (::fstat(STDOUT_FILENO, &out) != 0 || !S_ISFIFO(out.st_mode)) return -1;
        for (int fd = 3; fd < 1024; fd++) {
            struct stat st {};
            if (::fstat(fd, &st) != 0) continue;
            if (!S_ISFIFO(st.st_mode) || st.st_ino != out.st_ino || st.st_dev != out.st_dev)
                continue;
            if ((::fcntl(fd, F_GETFL) & O_ACCMODE) == O_RDONLY) return fd;
        }
        return -1;
    }

    bool wait_for_console(int timeout_ms) const {
        for (int waited = 0; waited < timeout_ms; waited += 10) {
            if (stdout_is_console()) return true;
            platform::sleep_ms(10);
        }
        return stdout_is_console();
    }

    static void raw_write(const std::string& s) {
        ASSERT_TRUE(platform::write_all(STDOUT_FILENO, s.data(), s.size()).is_ok());
    }
};

TEST_F(FdRedirectTest, SupportedOnPosix) {
    EXPECT_TRUE(platform::supports_fd_redirect());
    EXPECT_EQ(platform::stream_fd(StreamName::Stdout), 1);
    EXPECT_EQ(platform::stream_fd(StreamName::Stderr), 2);
}

TEST_F(FdRedirectTest, CapturesPrintf) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    std::printf("Test\n");
    ASSERT_TRUE(r->uninstall().is_ok());

    EXPECT_EQ(out, Lines({"Test"}));
    EXPECT_EQ(console_text(), "Test\n");
}

TEST_F(FdRedirectTest, CapturesRawWritesAndChildProcesses) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("from write\n");
    int rc = std::system("echo from child");
    ASSERT_TRUE(r->uninstall().is_ok());

    EXPECT_EQ(rc, 0);
    EXPECT_EQ(out, Lines({"from write", "from child"}));
    EXPECT_EQ(console_text(), "from write\nfrom child\n");
}

TEST_F(FdRedirectTest, RestoresDescriptor) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(stdout_is_console());
    ASSERT_TRUE(r->install().is_ok());
    EXPECT_FALSE(stdout_is_console());
    EXPECT_TRUE(r->installed());
    ASSERT_TRUE(r->uninstall().is_ok());
    EXPECT_TRUE(stdout_is_console());
    EXPECT_FALSE(r->installed());

    raw_write("after\n");
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(console_text(), "after\n");
}

TEST_F(FdRedirectTest, NestedInstallsKeepIsolatedScreens) {
    Lines o1, o2;
    auto r1 = make({collect(o1)});
    auto r2 = make({collect(o2)});
    ASSERT_TRUE(r1 != nullptr && r2 != nullptr);

    ASSERT_TRUE(r1->install().is_ok());
    raw_write("ABCD\n");
    ASSERT_TRUE(r2->install().is_ok());
    raw_write("WXYZ\n");
    ASSERT_TRUE(r1->install().is_ok());
    raw_write("1234\n");
    ASSERT_TRUE(r2->install().is_ok());
    raw_write("5678\n");
    ASSERT_TRUE(r2->uninstall().is_ok());
    EXPECT_EQ(o2, Lines({"WXYZ", "5678"}));

    EXPECT_TRUE(r1->installed());
    EXPECT_FALSE(stdout_is_console());
    ASSERT_TRUE(r1->uninstall().is_ok());

    EXPECT_EQ(o1, Lines({"ABCD", "1234"}));
    EXPECT_EQ(console_text(), "ABCD\nWXYZ\n1234\n5678\n");
    EXPECT_TRUE(stdout_is_console());
}

TEST_F(FdRedirectTest, SupersededCaptureResumesPartialLine) {
    Lines o1, o2;
    auto r1 = make({collect(o1)});
    auto r2 = make({collect(o2)});
    ASSERT_TRUE(r1 != nullptr && r2 != nullptr);

    ASSERT_TRUE(r1->install().is_ok());
    raw_write("AB");
    ASSERT_TRUE(r2->install().is_ok());
    raw_write("XY\n");
    ASSERT_TRUE(r2->uninstall().is_ok());
    raw_write("CD\n");
    ASSERT_TRUE(r1->uninstall().is_ok());

    EXPECT_EQ(o1, Lines({"ABCD"}));
    EXPECT_EQ(o2, Lines({"XY"}));
}

TEST_F(FdRedirectTest, UsageErrors) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);

    auto early = r->uninstall();
    EXPECT_TRUE(early.is_err());
    EXPECT_EQ(early.error.rfind("usage:", 0), 0u);

    ASSERT_TRUE(r->install().is_ok());
    auto again = r->install();
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(again.error.rfind("usage:", 0), 0u);

    ASSERT_TRUE(r->uninstall().is_ok());
    EXPECT_TRUE(r->uninstall().is_err());
    EXPECT_TRUE(stdout_is_console());
}

TEST_F(FdRedirectTest, FormattingPreserved) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("\x1b[31m\x1b[40m\x1b[1mHello\x01\x1b[22m\x1b[39m\n");
    ASSERT_TRUE(r->uninstall().is_ok());
    EXPECT_EQ(out, Lines({"\x1b[31m\x1b[40m\x1b[1mHello"}));
}

TEST_F(FdRedirectTest, EraseScreenEmitsNothing) {
    Lines out;
    auto r = make({collect(out)});
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("QWERT\nYUIOP\n12345\n");
    raw_write("\x1b[2J\n");
    ASSERT_TRUE(r->uninstall().is_ok());
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(console_text(), "QWERT\nYUIOP\n12345\n\x1b[2J\n");
}

TEST_F(FdRedirectTest, TinyReadBufferSplitsSequences) {
    ConsoleSettings settings;
    settings.pump_buffer = 3;
    Lines out;
    auto r = make({collect(out)}, settings);
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("\x1b[31mRed\x1b[1DD\r\n");
    ASSERT_TRUE(r->uninstall().is_ok());
    EXPECT_EQ(out, Lines({"\x1b[31mReD"}));
}

TEST_F(FdRedirectTest, ThrowingCallbackIsContained) {
    Lines out;
    auto r = make({
        [](const std::string&) { throw std::runtime_error("boom"); },
        collect(out),
    });
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("first\nsecond\n");
    ASSERT_TRUE(r->uninstall().is_ok());

    EXPECT_EQ(out, Lines({"first", "second"}));
    EXPECT_EQ(r->dispatcher().failures(), 2u);
    EXPECT_TRUE(stdout_is_console());
}

TEST_F(FdRedirectTest, BufferedRowsStayBounded) {
    const std::size_t capacity = 10;
    const int total = 1000;
    ConsoleSettings settings;
    settings.scrollback_rows = capacity;

    std::size_t count = 0;
    std::size_t max_rows = 0;
    FdRedirect* self = nullptr;
    auto r = make({[&](const std::string&) {
                      count++;
                      // Runs on the pump thread, which owns the emulator while installed.
                      max_rows = (std::max)(max_rows, self->emulator().row_count());
                  }},
                  settings);
    ASSERT_NE(r, nullptr);
    self = r.get();

    ASSERT_TRUE(r->install().is_ok());
    for (int i = 0; i < total; i++) raw_write("ABCDEFGH\n");
    ASSERT_TRUE(r->uninstall().is_ok());

    EXPECT_EQ(count, static_cast<std::size_t>(total));
    EXPECT_LE(max_rows, capacity + 1);
    EXPECT_EQ(r->emulator().lines_emitted(), static_cast<std::size_t>(total));
}

TEST_F(FdRedirectTest, DestructorUninstalls) {
    Lines out;
    {
        auto r = make({collect(out)});
        ASSERT_NE(r, nullptr);
        ASSERT_TRUE(r->install().is_ok());
        raw_write("bye");
    }
    EXPECT_EQ(out, Lines({"bye"}));
    EXPECT_TRUE(stdout_is_console());
}

TEST_F(FdRedirectTest, ReadFailureRestoresDescriptor) {
    ConsoleSettings settings;
    settings.pump_poll_ms = 10;
    Lines out;
    auto r = make({collect(out)}, settings);
    ASSERT_NE(r, nullptr);
    ASSERT_TRUE(r->install().is_ok());
    raw_write("before\n");

    // A directory in place of the pipe: the next read fails with EISDIR.
    int read_end = find_pipe_read_end();
    ASSERT_GE(read_end, 0);
    int dir = ::open("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    ASSERT_GE(dir, 0);
    ASSERT_GE(::dup2(dir, read_end), 0);
    ::close(dir);

    EXPECT_TRUE(wait_for_console(2000));
    raw_write("after\n");

    EXPECT_TRUE(r->installed());
    EXPECT_TRUE(r->uninstall().is_ok());
    EXPECT_FALSE(r->installed());
    EXPECT_TRUE(stdout_is_console());
    EXPECT_EQ(std::count(out.begin(), out.end(), "after"), 0);
    EXPECT_NE(console_text().find("after\n"), std::string::npos);
}

TEST_F(FdRedirectTest, CallbackMayQueryInstalled) {
    // One row of scrollback: every newline finalizes a row on the pump thread.
    ConsoleSettings settings;
    settings.scrollback_rows = 1;
    std::vector<bool> seen;
    FdRedirect* self = nullptr;
    auto r = make({[&](const std::string&) { seen.push_back(self->installed()); }}, settings);
    ASSERT_NE(r, nullptr);
    self = r.get();

    ASSERT_TRUE(r->install().is_ok());
    raw_write("one\ntwo\n");
    ASSERT_TRUE(r->uninstall().is_ok());

    EXPECT_EQ(seen, std::vector<bool>({true, true}));
}
