#pragma once

#include "wim/Encoding.hpp"
#include "wim/Options.hpp"
#include "wim/ProcessRunner.hpp"
#include "wim/UpdateCommand.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace wim {

inline constexpr const char* kDefaultImagexBin = "wimlib-imagex";

// Front end to the wimlib-imagex command line tool. Each operation is one
// blocking invocation; the object itself is immutable after construction and
// may be shared between threads as long as the runner is thread-safe.
class Wim {
    std::string imagex_bin_;
    ProcessRunner* runner_;
    Platform platform_;

public:
    // runner == nullptr selects the system runner. A caller-supplied runner
    // must outlive this object.
    explicit Wim(std::string imagex_bin = kDefaultImagexBin,
                 ProcessRunner* runner = nullptr,
                 Platform platform = host_platform());

    const std::string& imagex_bin() const { return imagex_bin_; }
    Platform platform() const { return platform_; }

    // wimlib-imagex capture <source> <outputWim> [flags]
    void capture(const std::string& output_wim, const std::string& source, const Options& options = {});

    // wimlib-imagex extract <inputWim> <image> <pathInArchive> [flags]
    // A non-empty output_dir overrides options.dest_dir. Returns stdout, which
    // holds the file data when options.to_stdout is set.
    std::string extract(const std::string& input_wim,
                        const std::string& path_in_archive,
                        const std::string& output_dir = {},
                        Options options = {});

    // wimlib-imagex info --xml <inputWim>, parsed into a tree (see xmlio::parse_xml).
    nlohmann::json info(const std::string& input_wim);

    // wimlib-imagex update <inputWim> <image> "<command>" [flags]
    void update(const std::string& input_wim, const UpdateCommand& command, Options options = {});

    void verify(const std::string& input_wim);

    // Raw `wimlib-imagex dir` listing.
    std::string dir(const std::string& input_wim);

    // One invocation: argv = [binary, action, positional..., flags...].
    // xml selects the XML decoding path; arguments are never inspected for it.
    // Returns the exit status and the normalized stdout.
    procutil::ProcResult invoke(const std::string& action,
                                const std::vector<std::string>& positional,
                                const std::vector<std::string>& flags = {},
                                bool xml = false);
};

} // namespace wim
