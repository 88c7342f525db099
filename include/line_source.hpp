#pragma once

#include <istream>
#include <sstream>
#include <string>

// Pull-based source of text lines, the raw feed of a commit walk
class LineSource {
public:
    virtual ~LineSource() = default;

    // Next line without its trailing newline; false once exhausted
    virtual bool readLine(std::string& line) = 0;

    // Called after the last line. Throws HistoryTraversalError if the
    // producer reported a failure.
    virtual void finish() {}

    // Abandon the source early (cancellation)
    virtual void close() {}
};

// Lines from an in-memory or file stream, used for recorded logs and tests
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& input) : input_(input) {}

    bool readLine(std::string& line) override {
        if (!std::getline(input_, line)) {
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        return true;
    }

private:
    std::istream& input_;
};

// Lines from a string the source owns
class StringLineSource : public LineSource {
public:
    explicit StringLineSource(std::string text) : stream_(std::move(text)), lines_(stream_) {}

    bool readLine(std::string& line) override { return lines_.readLine(line); }

private:
    std::istringstream stream_;
    StreamLineSource lines_;
};
