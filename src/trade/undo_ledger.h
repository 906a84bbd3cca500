#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace trade {

// Completed sub-operations of a multi-key change, each with its inverse.
// Unwinding runs the inverses newest first and never retries one.
class UndoLedger {
public:
    using Inverse = std::function<bool()>;

    struct UnwindReport {
        std::size_t reversed{0};
        std::vector<std::string> failed_steps;

        bool clean() const { return failed_steps.empty(); }
    };

    void record(std::string description, Inverse inverse);
    UnwindReport unwind();
    void commit();

    std::size_t size() const;
    bool empty() const;

private:
    struct Entry {
        std::string description;
        Inverse inverse;
    };

    std::vector<Entry> entries_;
};

}  // namespace trade
