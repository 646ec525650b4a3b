#pragma once

/**
 * @file CsvRecorder.hpp
 * @brief Scope channel recorder writing CSV
 *
 * Columns: step, time, then one column per channel label. Values are read
 * straight from the watched ports at Record() time.
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/io/Recorder.hpp>
#include <philbrick/signal/Port.hpp>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <string>
#include <vector>

namespace philbrick {

class CsvRecorder : public Recorder {
  public:
    struct Channel {
        std::string label;
        const Port *port;
    };

    CsvRecorder() = default;
    ~CsvRecorder() override {
        if (file_.is_open()) {
            file_.close();
        }
    }

    CsvRecorder(const CsvRecorder &) = delete;
    CsvRecorder &operator=(const CsvRecorder &) = delete;

    /**
     * @brief Watch a port (must be called before Open)
     */
    void AddChannel(const std::string &label, const Port &port) {
        if (file_.is_open()) {
            throw IOError("CsvRecorder: cannot add channel '" + label + "' after Open()");
        }
        channels_.push_back({label, &port});
    }

    void Open(const std::string &path) override {
        file_.open(path);
        if (!file_) {
            throw IOError("open", path, "cannot open for writing");
        }
        path_ = path;
        rows_ = 0;
        file_ << std::setprecision(std::numeric_limits<double>::max_digits10);
        file_ << "step,time";
        for (const auto &ch : channels_) {
            file_ << "," << Escape(ch.label);
        }
        file_ << "\n";
    }

    void Close() override {
        if (file_.is_open()) {
            file_.close();
            if (file_.fail()) {
                throw IOError("close", path_, "flush failed");
            }
        }
    }

    void Record(double time) override {
        if (!file_.is_open()) {
            throw IOError("CsvRecorder: Record() called before Open()");
        }
        file_ << rows_ << "," << time;
        for (const auto &ch : channels_) {
            file_ << "," << ch.port->Read();
        }
        file_ << "\n";
        ++rows_;
    }

    [[nodiscard]] const std::vector<Channel> &Channels() const { return channels_; }
    [[nodiscard]] int64_t RowCount() const { return rows_; }
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

  private:
    static std::string Escape(const std::string &field) {
        if (field.find_first_of(",\"\n") == std::string::npos) {
            return field;
        }
        std::string quoted = "\"";
        for (char c : field) {
            if (c == '"')
                quoted += '"';
            quoted += c;
        }
        return quoted + "\"";
    }

    std::vector<Channel> channels_;
    std::ofstream file_;
    std::string path_;
    int64_t rows_ = 0;
};

} // namespace philbrick
