#include "FakeProcessRunner.hpp"

#include "io/XmlIO.hpp"
#include "wim/Errors.hpp"
#include "wim/Wim.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <system_error>

using namespace wim;

using Args = std::vector<std::string>;

class WimTest : public ::testing::Test {
protected:
    FakeProcessRunner runner_;
    Wim posix_{"wimlib-imagex", &runner_, Platform::Posix};
    Wim windows_{"C:\\tools\\wimlib-imagex.exe", &runner_, Platform::Windows};

    static std::string utf16le(const std::string& ascii) {
        std::string out = "\xFF\xFE";
        for (char c : ascii) {
            out += c;
            out += '\0';
        }
        return out;
    }

    static bool mentions(const std::exception& e, const std::string& needle) {
        return std::string(e.what()).find(needle) != std::string::npos;
    }
};

TEST_F(WimTest, DefaultsToCanonicalBinary) {
    Wim w;
    EXPECT_EQ(w.imagex_bin(), "wimlib-imagex");
    EXPECT_EQ(w.platform(), host_platform());

    Wim empty_path("", &runner_);
    EXPECT_EQ(empty_path.imagex_bin(), "wimlib-imagex");
}

TEST_F(WimTest, CaptureArgv) {
    Options o;
    o.compress = "LZMS";
    o.unix_data = true;
    o.check = true;

    posix_.capture("out.wim", "/srv/root", o);

    const Args expected = {"wimlib-imagex", "capture", "/srv/root", "out.wim",
                           "--compress=LZMS", "--unix-data", "--check"};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, CaptureFailureThrows) {
    runner_.reply(1);
    EXPECT_THROW(posix_.capture("out.wim", "/srv/root"), CaptureError);
}

TEST_F(WimTest, ExtractDefaultsImageToOne) {
    runner_.reply(0, "payload");
    const std::string out = posix_.extract("in.wim", "/etc/hosts");

    const Args expected = {"wimlib-imagex", "extract", "in.wim", "1", "/etc/hosts"};
    EXPECT_EQ(runner_.last(), expected);
    EXPECT_EQ(out, "payload");
}

TEST_F(WimTest, ExtractKeepsExplicitImage) {
    Options o;
    o.image = 3;
    o.no_globs = true;
    posix_.extract("in.wim", "/", {}, o);

    const Args expected = {"wimlib-imagex", "extract", "in.wim", "3", "/", "--no-globs"};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, ExtractOutputDirMatchesDestDirOption) {
    posix_.extract("in.wim", "/data", "/tmp/x");
    const Args via_arg = runner_.last();

    Options o;
    o.dest_dir = "/tmp/x";
    posix_.extract("in.wim", "/data", {}, o);
    const Args via_option = runner_.last();

    EXPECT_EQ(via_arg, via_option);
    EXPECT_EQ(via_arg.back(), "--dest-dir=/tmp/x");
}

TEST_F(WimTest, ExtractOutputDirOverridesDestDir) {
    Options o;
    o.dest_dir = "/ignored";
    posix_.extract("in.wim", "/data", "/wins", o);
    EXPECT_EQ(runner_.last().back(), "--dest-dir=/wins");
}

TEST_F(WimTest, ExtractToStdoutIsNotCleaned) {
    Options o;
    o.to_stdout = true;
    runner_.reply(0, "\x01\x02\x03 raw bytes");
    EXPECT_EQ(windows_.extract("in.wim", "/bin/file", {}, o), "\x01\x02\x03 raw bytes");
    EXPECT_EQ(runner_.last().back(), "--to-stdout");
}

TEST_F(WimTest, ExtractFailureThrows) {
    runner_.reply(2);
    EXPECT_THROW(posix_.extract("in.wim", "/missing"), ExtractError);
}

TEST_F(WimTest, InfoDecodesUtf16OnPosix) {
    runner_.reply(0, utf16le("<WIM><IMAGE INDEX=\"1\"><NAME>Base</NAME></IMAGE></WIM>"));
    const nlohmann::json meta = posix_.info("in.wim");

    const Args expected = {"wimlib-imagex", "info", "--xml", "in.wim"};
    EXPECT_EQ(runner_.last(), expected);
    EXPECT_EQ(meta["WIM"]["IMAGE"][0]["$"]["INDEX"], "1");
    EXPECT_EQ(meta["WIM"]["IMAGE"][0]["NAME"][0], "Base");
}

TEST_F(WimTest, InfoCleansEightBitCaptureOnWindows) {
    runner_.reply(0, "\xEF\xBF~<~W~I~M~>~<~T~O~T~A~L~B~Y~T~E~S~>~9~<~/~T~O~T~A~L~B~Y~T~E~S~>~<~/~W~I~M~>~");
    const nlohmann::json meta = windows_.info("D:\\images\\base.wim");

    EXPECT_EQ(runner_.last().front(), "C:\\tools\\wimlib-imagex.exe");
    EXPECT_EQ(meta["WIM"]["TOTALBYTES"][0], "9");
}

TEST_F(WimTest, InfoEmptyOutputThrowsRetrievalError) {
    runner_.reply(0, "");
    try {
        posix_.info("empty.wim");
        FAIL() << "expected RetrievalError";
    } catch (const RetrievalError& e) {
        EXPECT_TRUE(mentions(e, "empty.wim"));
    }
}

TEST_F(WimTest, InfoNonZeroExitThrowsRetrievalError) {
    runner_.reply(1, utf16le("<WIM/>"));
    EXPECT_THROW(posix_.info("bad.wim"), RetrievalError);
}

TEST_F(WimTest, InfoMalformedXmlThrowsParseError) {
    runner_.reply(0, utf16le("<WIM><IMAGE></WIM>"));
    EXPECT_THROW(posix_.info("in.wim"), xmlio::XmlParseError);
}

TEST_F(WimTest, UpdateRendersCommandAndDefaultsImage) {
    UpdateCommand cmd{UpdateKind::Add, "a", "b"};
    Options o;
    o.rebuild = true;
    posix_.update("in.wim", cmd, o);

    const Args expected = {"wimlib-imagex", "update", "in.wim", "1", "add \"a\" \"b\"", "--rebuild"};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, UpdateRename) {
    Options o;
    o.image = 2;
    posix_.update("in.wim", {UpdateKind::Rename, "old", "new"}, o);

    const Args expected = {"wimlib-imagex", "update", "in.wim", "2", "rename \"old\" \"new\""};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, UpdateWithoutCommandNeverSpawns) {
    EXPECT_THROW(posix_.update("in.wim", UpdateCommand{}), MissingCommandError);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(WimTest, UpdateUnsupportedKindNeverSpawns) {
    UpdateCommand cmd;
    cmd.kind = static_cast<UpdateKind>(7);
    cmd.input = "a";
    cmd.output = "b";
    EXPECT_THROW(posix_.update("in.wim", cmd), UnsupportedCommandError);
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(WimTest, UpdateFailureThrows) {
    runner_.reply(1);
    EXPECT_THROW(posix_.update("in.wim", {UpdateKind::Delete, "/tmp", ""}), UpdateError);
}

TEST_F(WimTest, VerifySucceeds) {
    runner_.reply(0, "OK\n");
    EXPECT_NO_THROW(posix_.verify("good.wim"));

    const Args expected = {"wimlib-imagex", "verify", "good.wim"};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, VerifyNonZeroExitThrowsIntegrityError) {
    runner_.reply(1, "checksum mismatch");
    try {
        posix_.verify("broken.wim");
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_TRUE(mentions(e, "broken.wim"));
    }
}

TEST_F(WimTest, DirReturnsRawListing) {
    const std::string listing = "/\n/boot\n/boot/bcd\n";
    runner_.reply(0, listing);
    EXPECT_EQ(windows_.dir("in.wim"), listing);

    const Args expected = {"C:\\tools\\wimlib-imagex.exe", "dir", "in.wim"};
    EXPECT_EQ(runner_.last(), expected);
}

TEST_F(WimTest, DirFailuresThrowRetrievalError) {
    runner_.reply(0, "");
    EXPECT_THROW(posix_.dir("a.wim"), RetrievalError);

    runner_.reply(3, "partial");
    try {
        posix_.dir("b.wim");
        FAIL() << "expected RetrievalError";
    } catch (const RetrievalError& e) {
        EXPECT_TRUE(mentions(e, "b.wim"));
    }
}

namespace {

class ThrowingRunner final : public ProcessRunner {
public:
    procutil::ProcResult run(const std::vector<std::string>&) override {
        throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory), "spawn");
    }
};

} // namespace

TEST_F(WimTest, SpawnErrorsPropagateUnwrapped) {
    ThrowingRunner throwing;
    Wim w("wimlib-imagex", &throwing, Platform::Posix);
    EXPECT_THROW(w.verify("in.wim"), std::system_error);
    EXPECT_THROW(w.dir("in.wim"), std::system_error);
}

TEST(DryRunProcessRunnerTest, PrintsCommandLineAndSucceeds) {
    std::ostringstream out;
    DryRunProcessRunner dry(out);
    Wim w("wimlib-imagex", &dry, Platform::Posix);

    w.update("my image.wim", {UpdateKind::Add, "a", "b"});

    EXPECT_EQ(out.str(), "wimlib-imagex update 'my image.wim' 1 'add \"a\" \"b\"'\n");
}

TEST(FormatCommandLineTest, QuotesOnlyWhatNeedsIt) {
    EXPECT_EQ(format_command_line({"wimlib-imagex", "verify", "x.wim"}), "wimlib-imagex verify x.wim");
    EXPECT_EQ(format_command_line({"a", ""}), "a ''");
    EXPECT_EQ(format_command_line({"it's"}), "'it'\\''s'");
}

TEST_F(WimTest, ArchivePathSpelledLikeXmlFlagIsNotDecoded) {
    Options o;
    o.to_stdout = true;
    runner_.reply(0, "hello\n");
    EXPECT_EQ(posix_.extract("in.wim", "--xml", {}, o), "hello\n");

    runner_.reply(0, "\xEF\xBF listing");
    EXPECT_EQ(windows_.invoke("dir", {"--xml"}).out, "\xEF\xBF listing");
}

TEST_F(WimTest, ExplicitXmlInvokeDecodesUtf16) {
    runner_.reply(0, utf16le("<a/>"));
    EXPECT_EQ(posix_.invoke("info", {"--xml", "in.wim"}, {}, true).out, "<a/>");
}
