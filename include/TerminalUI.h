#pragma once
#include "Randomizer.h"
#include <ostream>
#include <string>
#include <vector>

// One row of the pass-through aggregate audit.
struct AggregateAuditRow {
    std::string column;
    long double inputTotal = 0.0L;
    long double outputTotal = 0.0L;
    bool inBoth = true;
    bool matches() const { return inBoth && inputTotal == outputTotal; }
};

class TerminalUI {
public:
    static void printShape(std::ostream& out, const std::string& label, size_t rows, size_t cols);

    // Trace lines: "<name> <old-type> <old-min> <new-type> <new-min>", then the skip count.
    static void printRandomizationTrace(std::ostream& out, const RandomizationReport& report);

    static void printAggregateAudit(std::ostream& out, const std::vector<AggregateAuditRow>& rows);

    static void printWarning(std::ostream& out, const std::string& message);
    static void printProgress(std::ostream& out, const std::string& message);
};
