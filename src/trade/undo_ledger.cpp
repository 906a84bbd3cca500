#include "trade/undo_ledger.h"

#include <utility>

namespace trade {

void UndoLedger::record(std::string description, Inverse inverse) {
    entries_.push_back(Entry{std::move(description), std::move(inverse)});
}

UndoLedger::UnwindReport UndoLedger::unwind() {
    UnwindReport report;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->inverse()) {
            ++report.reversed;
        } else {
            report.failed_steps.push_back(it->description);
        }
    }
    entries_.clear();
    return report;
}

void UndoLedger::commit() {
    entries_.clear();
}

std::size_t UndoLedger::size() const {
    return entries_.size();
}

bool UndoLedger::empty() const {
    return entries_.empty();
}

}  // namespace trade
