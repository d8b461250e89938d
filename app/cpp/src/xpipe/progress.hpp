#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace xpipe {

struct TransferProgress {
    std::uint64_t transferred = 0;
    // none while the length is unknown
    std::optional<std::uint64_t> total;
};

class ProgressListener {
   public:
    virtual ~ProgressListener() = default;
    virtual void on_progress(const TransferProgress& progress) = 0;
    virtual void on_finish(const TransferProgress&) {}
    // transfer interrupted by an error before finish
    virtual void on_abort(const TransferProgress&) {}
};

// Progress state of one transfer, forwarded to an optional listener.
// transferred only grows, and a known total is raised when exceeded.
// Destroyed without finish() means the transfer was aborted.
class ProgressTracker {
   public:
    explicit ProgressTracker(ProgressListener* listener)
        : _listener(listener),
          _finished(false) {
    }
    ~ProgressTracker() {
        if (!_finished && _listener != nullptr) {
            _listener->on_abort(_state);
        }
    }
    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    void set_total(std::optional<std::uint64_t> total) {
        _state.total = total;
        clamp();
        notify();
    }
    void advance(std::uint64_t count) {
        _state.transferred += count;
        clamp();
        notify();
    }
    void finish() {
        if (_finished) {
            return;
        }
        _finished = true;
        if (_listener != nullptr) {
            _listener->on_finish(_state);
        }
    }
    const TransferProgress& state() const {
        return _state;
    }

   private:
    ProgressListener* _listener;
    TransferProgress _state;
    bool _finished;

    void clamp() {
        if (_state.total.has_value() && _state.transferred > _state.total.value()) {
            _state.total = _state.transferred;
        }
    }
    void notify() {
        if (_listener != nullptr) {
            _listener->on_progress(_state);
        }
    }
};

// Human readable size, decimal units
inline std::string format_bytes(std::uint64_t bytes) {
    static const std::array<const char*, 5> units = {"kB", "MB", "GB", "TB", "PB"};
    if (bytes < 1000) {
        return std::to_string(bytes) + "B";
    }
    double value = static_cast<double>(bytes) / 1000.0;
    std::size_t unit = 0;
    while (value >= 1000.0 && unit + 1 < units.size()) {
        value /= 1000.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << units[unit];
    return oss.str();
}

// Single line progress bar, redrawn in place
// Without a known total it only counts up.
class ProgressBar : public ProgressListener {
   public:
    explicit ProgressBar(std::ostream& out, std::size_t width = 30)
        : _out(out),
          _width(width) {
    }

    void on_progress(const TransferProgress& progress) override {
        _out << '\r' << render(progress) << std::flush;
    }

    void on_finish(const TransferProgress& progress) override {
        _out << '\r' << render(progress) << std::endl;
    }

    // keep the partial bar, the error message goes on the next line
    void on_abort(const TransferProgress&) override {
        _out << std::endl;
    }

    std::string render(const TransferProgress& progress) const {
        std::ostringstream line;
        if (!progress.total.has_value() || progress.total.value() == 0) {
            line << format_bytes(progress.transferred);
            return line.str();
        }
        const std::uint64_t total = progress.total.value();
        const std::uint64_t done = std::min(progress.transferred, total);
        const auto filled = static_cast<std::size_t>(done * _width / total);
        line << '[' << std::string(filled, '#') << std::string(_width - filled, '.') << "] "
             << std::setw(3) << (done * 100 / total) << "% "
             << format_bytes(done) << '/' << format_bytes(total);
        return line.str();
    }

   private:
    std::ostream& _out;
    const std::size_t _width;
};
}  // namespace xpipe
