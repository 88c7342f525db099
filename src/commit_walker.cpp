#include "commit_walker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::vector<std::string> splitFields(const std::string& str, char delim) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(start));
            return fields;
        }
        fields.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

bool isObjectId(const std::string& id) {
    if (id.size() != 40 && id.size() != 64) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    });
}

std::string unquoteGitPath(const std::string& path) {
    if (path.size() < 2 || path.front() != '"' || path.back() != '"') {
        return path;
    }

    const std::string body = path.substr(1, path.size() - 2);
    std::string result;
    result.reserve(body.size());
    for (size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            result += c;
            continue;
        }

        char next = body[++i];
        switch (next) {
            case 'a': result += '\a'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'v': result += '\v'; break;
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            default:
                if (next >= '0' && next <= '7') {
                    // Up to three octal digits encode one raw byte
                    int value = next - '0';
                    for (int digits = 1; digits < 3 && i + 1 < body.size() &&
                                         body[i + 1] >= '0' && body[i + 1] <= '7'; ++digits) {
                        value = value * 8 + (body[++i] - '0');
                    }
                    result += static_cast<char>(value);
                } else {
                    result += '\\';
                    result += next;
                }
        }
    }
    return result;
}

CommitWalker::CommitWalker(std::unique_ptr<LineSource> source)
    : source_(std::move(source)) {}

CommitWalker::~CommitWalker() {
    if (source_ && !exhausted_) {
        source_->close();
    }
}

void CommitWalker::stop() {
    if (source_ && !exhausted_) {
        source_->close();
    }
    exhausted_ = true;
}

bool CommitWalker::next(Commit& commit) {
    while (!exhausted_) {
        Commit candidate;
        if (!readRecord(candidate)) {
            exhausted_ = true;
            source_->finish();
            return false;
        }

        if (seen_.count(candidate.id) > 0) {
            ++duplicatesSkipped_;
            continue;
        }

        for (const auto& parent : candidate.parents) {
            if (parent == candidate.id) {
                throw HistoryTraversalError("Commit " + candidate.id + " lists itself as a parent");
            }
            if (seen_.count(parent) > 0) {
                throw HistoryTraversalError("Parent " + parent + " of commit " + candidate.id +
                                            " appeared before its child");
            }
        }

        seen_.insert(candidate.id);
        commit = std::move(candidate);
        return true;
    }
    return false;
}

bool CommitWalker::readRecord(Commit& commit) {
    std::string line;

    // Locate the header, either left over from the previous record or next in the stream
    if (hasPendingHeader_) {
        line = std::move(pendingHeader_);
        hasPendingHeader_ = false;
    } else {
        while (true) {
            if (!source_->readLine(line)) {
                return false;
            }
            if (!line.empty() && line[0] == COMMIT_RECORD_MARK) {
                break;
            }
            if (!isBlank(line)) {
                throw HistoryTraversalError("Unexpected history output outside a commit record: " + line);
            }
        }
    }

    parseHeader(line, commit);

    // Status lines run until the next header or the end of input
    while (source_->readLine(line)) {
        if (!line.empty() && line[0] == COMMIT_RECORD_MARK) {
            pendingHeader_ = std::move(line);
            hasPendingHeader_ = true;
            break;
        }
        if (isBlank(line)) {
            continue;
        }
        parseStatusLine(line, commit);
    }

    return true;
}

void CommitWalker::parseHeader(const std::string& header, Commit& commit) const {
    auto fields = splitFields(header.substr(1), COMMIT_FIELD_SEPARATOR);
    if (fields.size() != 3) {
        throw HistoryTraversalError("Malformed commit header: " + header.substr(1));
    }

    commit.id = fields[0];
    if (!isObjectId(commit.id)) {
        throw HistoryTraversalError("Invalid commit id: " + commit.id);
    }

    std::stringstream parents(fields[1]);
    std::string parent;
    while (parents >> parent) {
        if (!isObjectId(parent)) {
            throw HistoryTraversalError("Invalid parent id " + parent + " in commit " + commit.id);
        }
        commit.parents.push_back(parent);
    }

    try {
        size_t consumed = 0;
        commit.authorTime = std::stoll(fields[2], &consumed);
        if (consumed != fields[2].size()) {
            throw std::invalid_argument(fields[2]);
        }
    } catch (const std::logic_error&) {
        throw HistoryTraversalError("Invalid author time '" + fields[2] + "' in commit " + commit.id);
    }
}

void CommitWalker::parseStatusLine(const std::string& line, Commit& commit) const {
    // <status>[score]\t<path>[\t<new path>]
    auto fields = splitFields(line, '\t');
    if (fields.size() < 2 || fields[0].empty()) {
        throw HistoryTraversalError("Malformed change line in commit " + commit.id + ": " + line);
    }

    FileChange change;
    change.kind = changeKindFromStatus(fields[0][0]);

    if (change.kind == ChangeKind::Renamed || change.kind == ChangeKind::Copied) {
        if (fields.size() < 3) {
            throw HistoryTraversalError("Rename without target in commit " + commit.id + ": " + line);
        }
        change.previousPath = unquoteGitPath(fields[1]);
        change.path = unquoteGitPath(fields[2]);
    } else {
        change.path = unquoteGitPath(fields[1]);
    }

    commit.changes.push_back(std::move(change));
}
