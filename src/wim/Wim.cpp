#include "wim/Wim.hpp"

#include "io/XmlIO.hpp"
#include "util/Logger.hpp"
#include "wim/Errors.hpp"

#include <utility>

using util::Logger;

namespace wim {

static SystemProcessRunner& system_runner() {
    static SystemProcessRunner runner;
    return runner;
}

Wim::Wim(std::string imagex_bin, ProcessRunner* runner, Platform platform)
    : imagex_bin_(std::move(imagex_bin)),
      runner_(runner ? runner : &system_runner()),
      platform_(platform) {
    if (imagex_bin_.empty()) imagex_bin_ = kDefaultImagexBin;
}

procutil::ProcResult Wim::invoke(const std::string& action,
                                 const std::vector<std::string>& positional,
                                 const std::vector<std::string>& flags,
                                 bool xml) {
    std::vector<std::string> argv;
    argv.reserve(2 + positional.size() + flags.size());
    argv.push_back(imagex_bin_);
    argv.push_back(action);
    argv.insert(argv.end(), positional.begin(), positional.end());
    argv.insert(argv.end(), flags.begin(), flags.end());

    const CaptureEncoding enc = choose_capture_encoding(platform_, xml);

    Logger::debug("exec: " + format_command_line(argv));

    procutil::ProcResult res = runner_->run(argv);

    Logger::debug(action + ": exit " + std::to_string(res.exit_code) + ", " +
                  std::to_string(res.out.size()) + " bytes of output");

    if (enc == CaptureEncoding::Utf8 && xml) {
        Logger::debug(action + ": stripping mis-encoded XML output; characters equal to the noise marker are lost");
    }
    res.out = normalize_output(res.out, enc, xml);
    return res;
}

void Wim::capture(const std::string& output_wim, const std::string& source, const Options& options) {
    const auto res = invoke("capture", {source, output_wim}, build_option_args(options));
    if (res.exit_code != 0) {
        Logger::warn("capture of " + source + " failed with exit code " + std::to_string(res.exit_code));
        throw CaptureError("Cannot capture " + source + " into " + output_wim);
    }
}

std::string Wim::extract(const std::string& input_wim,
                         const std::string& path_in_archive,
                         const std::string& output_dir,
                         Options options) {
    if (options.image == 0) options.image = 1;
    if (!output_dir.empty()) options.dest_dir = output_dir;

    auto res = invoke("extract",
                      {input_wim, std::to_string(options.image), path_in_archive},
                      build_option_args(options));
    if (res.exit_code != 0) {
        Logger::warn("extract from " + input_wim + " failed with exit code " + std::to_string(res.exit_code));
        throw ExtractError("Cannot extract " + path_in_archive + " from " + input_wim);
    }
    return std::move(res.out);
}

nlohmann::json Wim::info(const std::string& input_wim) {
    const auto res = invoke("info", {"--xml", input_wim}, {}, true);
    if (res.out.empty() || res.exit_code != 0) {
        Logger::warn("info on " + input_wim + ": exit code " + std::to_string(res.exit_code) +
                     (res.out.empty() ? ", no output" : ""));
        throw RetrievalError("Cannot retrieve WIM metadata from " + input_wim);
    }
    return xmlio::parse_xml(res.out);
}

void Wim::update(const std::string& input_wim, const UpdateCommand& command, Options options) {
    if (options.image == 0) options.image = 1;
    if (command.input.empty()) throw MissingCommandError("A command must be specified");

    const std::string rendered = render_update_command(command);

    const auto res = invoke("update",
                            {input_wim, std::to_string(options.image), rendered},
                            build_option_args(options));
    if (res.exit_code != 0) {
        Logger::warn("update of " + input_wim + " failed with exit code " + std::to_string(res.exit_code));
        throw UpdateError("Cannot apply '" + rendered + "' to " + input_wim);
    }
}

void Wim::verify(const std::string& input_wim) {
    const auto res = invoke("verify", {input_wim});
    if (res.exit_code != 0) {
        Logger::warn("verify of " + input_wim + " failed with exit code " + std::to_string(res.exit_code));
        throw IntegrityError("Integrity of " + input_wim + " file seems compromised");
    }
}

std::string Wim::dir(const std::string& input_wim) {
    auto res = invoke("dir", {input_wim});
    if (res.out.empty() || res.exit_code != 0) {
        Logger::warn("dir on " + input_wim + ": exit code " + std::to_string(res.exit_code) +
                     (res.out.empty() ? ", no output" : ""));
        throw RetrievalError("Cannot retrieve WIM directories and files from " + input_wim);
    }
    return std::move(res.out);
}

} // namespace wim
