#include "history_selector.hpp"
#include "git_repository.hpp"
#include <sstream>
#include <stdexcept>

HistorySelector HistorySelector::all() {
    HistorySelector selector;
    selector.kind_ = Kind::AllRefs;
    return selector;
}

HistorySelector HistorySelector::refs(const std::vector<std::string>& names) {
    HistorySelector selector;
    selector.kind_ = Kind::NamedRefs;
    selector.refNames_ = names;
    return selector;
}

HistorySelector HistorySelector::range(const std::string& revisions) {
    // git would read a leading dash as one of its own options
    if (revisions.empty() || revisions.front() == '-') {
        throw std::invalid_argument("Invalid revision range: '" + revisions + "'");
    }
    HistorySelector selector;
    selector.kind_ = Kind::Range;
    selector.rangeRevisions_ = revisions;
    return selector;
}

std::string HistorySelector::describe() const {
    switch (kind_) {
        case Kind::AllRefs:
            return "all refs";
        case Kind::NamedRefs: {
            std::stringstream ss;
            ss << "refs ";
            for (size_t i = 0; i < refNames_.size(); ++i) {
                if (i > 0) {
                    ss << ", ";
                }
                ss << refNames_[i];
            }
            return ss.str();
        }
        case Kind::Range:
            return "range " + rangeRevisions_;
    }
    return "unknown selection";
}

std::vector<HistoryPartition> HistorySelector::plan(const GitRepository& repo, WarningList& warnings) const {
    std::vector<HistoryPartition> partitions;

    if (kind_ == Kind::Range) {
        HistoryPartition partition;
        partition.label = rangeRevisions_;
        partition.include.push_back(rangeRevisions_);
        partitions.push_back(std::move(partition));
        return partitions;
    }

    std::vector<RefHead> heads = kind_ == Kind::AllRefs
        ? repo.listRefHeads()
        : repo.resolveRefs(refNames_, warnings);

    // A head git cannot read would poison every later partition's exclusion list
    std::vector<std::string> usableHeads;
    for (const auto& head : heads) {
        if (!repo.verifyCommit(head.commitId)) {
            warnings.push_back({"history", head.name,
                                "head " + head.commitId + " is missing or is not a commit"});
            continue;
        }

        HistoryPartition partition;
        partition.label = head.name;
        partition.include.push_back(head.commitId);
        partition.exclude = usableHeads;
        partitions.push_back(std::move(partition));

        usableHeads.push_back(head.commitId);
    }

    return partitions;
}
