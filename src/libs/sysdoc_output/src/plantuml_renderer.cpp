#include <sysdoc_output/plantuml_renderer.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_common/logging.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <utility>
#include <csignal>
#include <unistd.h>

namespace sysdoc_output {

namespace {

// Single-quotes `s` for /bin/sh.
std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

// Ignores SIGPIPE while alive so a command that exits early surfaces as a
// failed write instead of terminating the process.
class SigpipeIgnored {
public:
    SigpipeIgnored() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        installed_ = sigaction(SIGPIPE, &ignore, &previous_) == 0;
    }
    ~SigpipeIgnored() {
        if (installed_) sigaction(SIGPIPE, &previous_, nullptr);
    }
    SigpipeIgnored(const SigpipeIgnored&) = delete;
    SigpipeIgnored& operator=(const SigpipeIgnored&) = delete;

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

// Removes a scratch file on scope exit.
class ScratchFile {
public:
    explicit ScratchFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Write end of a popen() pipe, closed on destruction.
class OutputPipe {
public:
    explicit OutputPipe(const std::string& command) : pipe_(popen(command.c_str(), "w")) {}
    ~OutputPipe() {
        if (pipe_) pclose(pipe_);
    }
    OutputPipe(const OutputPipe&) = delete;
    OutputPipe& operator=(const OutputPipe&) = delete;

    bool is_open() const { return pipe_ != nullptr; }

    bool write(const std::string& data) {
        return std::fwrite(data.data(), 1, data.size(), pipe_) == data.size() && std::fflush(pipe_) == 0;
    }

    // Exit status of the command, -1 if it could not be collected.
    int close() {
        const int status = pclose(pipe_);
        pipe_ = nullptr;
        return status;
    }

private:
    FILE* pipe_;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw RenderError("Cannot read rendered " + path.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

PlantUmlRenderer::PlantUmlRenderer(std::string command) : command_(std::move(command)) {}

void PlantUmlRenderer::render(const std::string& text, const std::filesystem::path& svg_file) const {
    const std::string command = command_ + " -pipe -tsvg > " + shell_quote(svg_file.string());
    sysdoc_common::logger()->debug("Running {}", command);

    SigpipeIgnored sigpipe_guard;
    OutputPipe pipe(command);
    if (!pipe.is_open())
        throw RenderError("Cannot start " + command_);
    const bool written = pipe.write(text);
    const int status = pipe.close();
    if (!written || status != 0) {
        std::error_code ec;
        std::filesystem::remove(svg_file, ec);
        throw RenderError("Rendering " + svg_file.filename().string() + " with " + command_
            + " failed (status " + std::to_string(status) + ")");
    }
}

std::vector<std::filesystem::path> PlantUmlRenderer::render_to_files(const sysdoc_model::DiagramTexts& texts,
    const std::filesystem::path& target_folder) const
{
    const std::filesystem::path folder = target_folder / svg_subfolder;
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec)
        throw RenderError("Cannot create " + folder.string() + ": " + ec.message());

    std::vector<std::filesystem::path> files;
    for (const auto& entry : texts) {
        const std::filesystem::path file = folder / svg_file_name(entry.first);
        render(entry.second, file);
        files.push_back(file);
    }
    return files;
}

sysdoc_model::DiagramTexts PlantUmlRenderer::render_to_strings(const sysdoc_model::DiagramTexts& texts) const {
    const ScratchFile scratch(std::filesystem::temp_directory_path()
        / ("sysdoc_render_" + std::to_string(getpid()) + ".svg"));

    sysdoc_model::DiagramTexts svgs;
    for (const auto& entry : texts) {
        render(entry.second, scratch.path());
        svgs[svg_file_name(entry.first)] = read_file(scratch.path());
    }
    return svgs;
}

std::string svg_file_name(const std::string& key) {
    return sysdoc_diagrams::split_output_key(key).first + ".svg";
}

} // namespace sysdoc_output
