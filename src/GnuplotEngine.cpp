#include "GnuplotEngine.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
namespace fs = std::filesystem;

std::string gpString(const std::string& text) {
    std::string out = "'";
    for (char ch : text) {
        out += ch;
        if (ch == '\'') out += '\'';
    }
    return out + "'";
}

std::string tickLabel(const std::string& label) {
    return label.size() <= 14 ? label : label.substr(0, 12) + "..";
}

std::string gnuplotPath() {
    const char* env = std::getenv("PATH");
    std::string dirs = env ? env : "";
    size_t start = 0;
    while (start <= dirs.size()) {
        const size_t end = std::min(dirs.find(':', start), dirs.size());
        const fs::path dir = end > start ? fs::path(dirs.substr(start, end - start)) : fs::path(".");
        const fs::path exe = dir / "gnuplot";
        if (::access(exe.c_str(), X_OK) == 0) return exe.string();
        start = end + 1;
    }
    return "";
}

class SpawnActions {
public:
    SpawnActions() { ok_ = ::posix_spawn_file_actions_init(&actions_) == 0; }
    ~SpawnActions() {
        if (ok_) ::posix_spawn_file_actions_destroy(&actions_);
    }
    SpawnActions(const SpawnActions&) = delete;
    SpawnActions& operator=(const SpawnActions&) = delete;

    bool redirectStderr(int fd) {
        return ok_ && ::posix_spawn_file_actions_adddup2(&actions_, fd, STDERR_FILENO) == 0;
    }
    const posix_spawn_file_actions_t* get() const { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
    bool ok_ = false;
};

// Exit status of `gnuplot script`, or -1 when the process could not be run.
int runGnuplot(const std::string& exe, const std::string& script, const std::string& logPath) {
    const int logFd = ::open(logPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (logFd < 0) return -1;

    SpawnActions actions;
    int status = -1;
    if (actions.redirectStderr(logFd)) {
        char* argv[] = {const_cast<char*>(exe.c_str()), const_cast<char*>(script.c_str()), nullptr};
        pid_t pid = -1;
        if (::posix_spawn(&pid, exe.c_str(), actions.get(), nullptr, argv, environ) == 0 &&
            ::waitpid(pid, &status, 0) == pid && WIFEXITED(status)) {
            status = WEXITSTATUS(status);
        } else {
            status = -1;
        }
    }
    ::close(logFd);
    return status;
}
} // namespace

GnuplotEngine::GnuplotEngine(std::string assetsDir, PlotConfig cfg)
    : assetsDir_(std::move(assetsDir)), cfg_(std::move(cfg)) {}

bool GnuplotEngine::isAvailable() const {
    return !gnuplotPath().empty();
}

std::string GnuplotEngine::heatmapScript(const ConfusionMatrix& cm,
                                         const std::string& title,
                                         const std::string& outputPath,
                                         const PlotConfig& cfg) {
    const size_t k = cm.labels.size();
    size_t peak = 1;
    for (const auto& row : cm.counts) {
        for (size_t v : row) peak = std::max(peak, v);
    }

    std::ostringstream s;
    s << "set terminal " << (cfg.format == "svg" ? "svg" : "pngcairo")
      << " size " << cfg.width << "," << cfg.height << " enhanced\n";
    s << "set output " << gpString(outputPath) << "\n";
    s << "set title " << gpString(title) << " font ',14'\n";
    s << "set tics out nomirror\nunset key\n";
    s << "set palette defined (0 '#f3f4f6', 1 '#1e3a8a')\n";
    s << "set cbrange [0:" << peak << "]\n";
    const double upper = static_cast<double>(k) - 0.5;
    s << "set xrange [-0.5:" << upper << "]\nset yrange [-0.5:" << upper << "]\n";
    s << "set xlabel 'Predicted label'\nset ylabel 'True label'\n";

    // First true label is the top row.
    std::ostringstream xtics, ytics;
    for (size_t i = 0; i < k; ++i) {
        const char* sep = i ? ", " : "";
        xtics << sep << gpString(tickLabel(cm.labels[i])) << " " << i;
        ytics << sep << gpString(tickLabel(cm.labels[i])) << " " << (k - 1 - i);
    }
    s << "set xtics (" << xtics.str() << ") font ',9'\n";
    s << "set ytics (" << ytics.str() << ") font ',9'\n";

    s << "$counts << EOD\n";
    for (size_t r = 0; r < k; ++r) {
        for (size_t c = 0; c < k; ++c) s << c << " " << (k - 1 - r) << " " << cm.counts[r][c] << "\n";
    }
    s << "EOD\n";
    s << "plot $counts using 1:2:3 with image, "
         "$counts using 1:2:(sprintf('%d', int($3))) with labels tc rgb '#111827'\n";
    return s.str();
}

std::string GnuplotEngine::confusionMatrix(const std::string& id, const ConfusionMatrix& cm, const std::string& title) {
    if (cm.labels.empty()) return "";
    const std::string exe = gnuplotPath();
    if (exe.empty()) return "";

    std::string stem = id.empty() ? "plot" : id;
    std::replace_if(stem.begin(), stem.end(), [](unsigned char c) { return !std::isalnum(c) && c != '_' && c != '-'; }, '_');
    const fs::path base = fs::path(assetsDir_) / stem;
    const std::string image = base.string() + "." + cfg_.format;
    const std::string script = base.string() + ".plt";
    const std::string log = base.string() + ".err.log";

    {
        std::ofstream out(script, std::ios::binary);
        out << heatmapScript(cm, title, image, cfg_);
        if (!out.good()) return "";
    }
    const int rc = runGnuplot(exe, script, log);
    std::error_code ec;
    fs::remove(script, ec);

    if (rc != 0 || !fs::exists(image, ec)) {
        std::ifstream errIn(log);
        std::string firstLine;
        std::getline(errIn, firstLine);
        std::cerr << "[Augur][Plot] gnuplot exited with rc=" << rc << " for " << image;
        if (!firstLine.empty()) std::cerr << ": " << firstLine;
        std::cerr << " (log: " << log << ")\n";
        return "";
    }
    fs::remove(log, ec);
    return image;
}
