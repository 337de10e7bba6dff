#include "TerminalUI.h"
#include "TaxDataset.h"
#include <algorithm>
#include <iomanip>

void TerminalUI::printShape(std::ostream& out, const std::string& label, size_t rows, size_t cols) {
    out << "[TaxSynth] " << label << ": (" << rows << ", " << cols << ")\n";
}

void TerminalUI::printRandomizationTrace(std::ostream& out, const RandomizationReport& report) {
    for (const auto& col : report.columns) {
        out << col.name << " " << col.oldType << " ";
        if (col.oldType == "int64") {
            out << static_cast<long long>(col.oldMin);
        } else {
            std::string text;
            appendReal(text, col.oldMin);
            out << text;
        }
        out << " " << col.newType << " " << col.newMin << "\n";
    }
    out << "[TaxSynth] randomization skips: " << report.skipCount << "\n";
}

void TerminalUI::printAggregateAudit(std::ostream& out, const std::vector<AggregateAuditRow>& rows) {
    size_t maxNameLen = 15;
    for (const auto& row : rows) maxNameLen = std::max(maxNameLen, row.column.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    out << "\n============================== PASS-THROUGH AGGREGATES ==============================\n";
    out << std::left
        << std::setw(w) << "Column"
        << std::setw(24) << "Input total"
        << std::setw(24) << "Output total"
        << "Status\n";
    out << std::string(static_cast<size_t>(w) + 24 * 2 + 8, '-') << "\n";
    for (const auto& row : rows) {
        out << std::left << std::setw(w) << row.column
            << std::fixed << std::setprecision(2)
            << std::setw(24) << static_cast<double>(row.inputTotal)
            << std::setw(24) << static_cast<double>(row.outputTotal)
            << (row.matches() ? "ok" : "MISMATCH") << "\n";
    }
    out << std::defaultfloat << std::setprecision(6) << std::right;
    out << "=====================================================================================\n";
}

void TerminalUI::printWarning(std::ostream& out, const std::string& message) {
    out << "[TaxSynth][Warning] " << message << "\n";
}

void TerminalUI::printProgress(std::ostream& out, const std::string& message) {
    out << "[TaxSynth] " << message << "\n";
}
