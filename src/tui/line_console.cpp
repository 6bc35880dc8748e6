#include "tui/line_console.h"
#include "utils/utils.h"

#include <stdexcept>
#include <string>

namespace avatarcli {
namespace tui {

using utils::Formatter;

static std::optional<size_t> parseChoice(const std::string& text, size_t count) {
    try {
        size_t used = 0;
        long choice = std::stol(text, &used);
        if (used != text.size() || choice < 1 || static_cast<size_t>(choice) > count) return std::nullopt;
        return static_cast<size_t>(choice);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

LineConsole::LineConsole(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool LineConsole::init() {
    return true;
}

void LineConsole::shutdown() {
    out_.flush();
}

bool LineConsole::readLine(std::string& line) {
    if (eof_ || !std::getline(in_, line)) {
        eof_ = true;
        line.clear();
        return false;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

std::optional<std::string> LineConsole::menu(const std::string& title, const std::vector<std::string>& options) {
    if (options.empty()) return std::nullopt;

    bool hasPrev = false;
    bool hasNext = false;
    for (const auto& opt : options) {
        if (opt == PREVIOUS_PAGE_LABEL) hasPrev = true;
        if (opt == NEXT_PAGE_LABEL) hasNext = true;
    }

    while (true) {
        out_ << "\n" << title << "\n";
        for (size_t i = 0; i < options.size(); ++i) {
            out_ << "  " << Formatter::padLeft(std::to_string(i + 1), 3) << ") " << options[i] << "\n";
        }
        out_ << "Select [1-" << options.size() << "]";
        if (hasPrev) out_ << ", p = previous";
        if (hasNext) out_ << ", n = next";
        out_ << ", q = back: " << std::flush;

        std::string line;
        if (!readLine(line)) return std::nullopt;
        line = Formatter::trim(line);
        if (line.empty() || line == "q" || line == "Q") return std::nullopt;
        if (hasPrev && (line == "p" || line == "P")) return std::string(PREVIOUS_PAGE_LABEL);
        if (hasNext && (line == "n" || line == "N")) return std::string(NEXT_PAGE_LABEL);

        if (auto choice = parseChoice(line, options.size())) {
            return options[*choice - 1];
        }
        out_ << "Invalid choice: " << line << "\n";
    }
}

std::string LineConsole::prompt(const std::string& message) {
    out_ << message << " " << std::flush;
    std::string line;
    readLine(line);
    return Formatter::trim(line);
}

bool LineConsole::confirm(const std::string& message) {
    out_ << message << " (y/N) " << std::flush;
    std::string line;
    if (!readLine(line)) return false;
    line = Formatter::toLower(Formatter::trim(line));
    return line == "y" || line == "yes";
}

void LineConsole::showMessage(const std::string& msg, Color) {
    out_ << msg << "\n";
}

void LineConsole::showError(const std::string& err) {
    out_ << err << "\n";
}

void LineConsole::showDetails(const std::string& title, const std::string& text) {
    out_ << "\n" << title << "\n" << Formatter::repeat("-", static_cast<int>(title.size())) << "\n";
    out_ << text << "\n";
    waitForKey("Press Enter to continue...");
}

void LineConsole::waitForKey(const std::string& message) {
    out_ << message << std::flush;
    std::string line;
    readLine(line);
    out_ << "\n";
}

void LineConsole::beginBusy(const std::string& label) {
    out_ << label << "..." << std::endl;
}

void LineConsole::endBusy() {}

}
}
