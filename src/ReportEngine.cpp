#include "ReportEngine.h"
#include "AugurExceptions.h"

#include <filesystem>
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}

std::string relativeLinkTarget(const std::string& target, const std::filesystem::path& reportDir) {
    const std::filesystem::path raw(target);
    if (!raw.is_absolute()) return raw.generic_string();
    std::error_code ec;
    const std::filesystem::path rel = std::filesystem::relative(raw, reportDir, ec);
    if (!ec && !rel.empty()) return rel.generic_string();
    return raw.generic_string();
}

std::string normalizeImageLinks(const std::string& markdown, const std::filesystem::path& reportDir) {
    std::string out;
    out.reserve(markdown.size() + 64);

    size_t cursor = 0;
    while (true) {
        const size_t start = markdown.find("](", cursor);
        if (start == std::string::npos) {
            out.append(markdown.substr(cursor));
            break;
        }
        const size_t targetStart = start + 2;
        const size_t end = markdown.find(')', targetStart);
        if (end == std::string::npos) {
            out.append(markdown.substr(cursor));
            break;
        }
        out.append(markdown.substr(cursor, targetStart - cursor));
        out.append(relativeLinkTarget(markdown.substr(targetStart, end - targetStart), reportDir));
        out.push_back(')');
        cursor = end + 1;
    }
    return out;
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addHeading(const std::string& heading, int level) {
    body_ += std::string(static_cast<size_t>(level < 1 ? 1 : level), '#') + " " + heading + "\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBulletList(const std::vector<std::string>& items, const std::string& emptyPlaceholder) {
    if (items.empty()) {
        body_ += "- " + emptyPlaceholder + "\n\n";
        return;
    }
    for (const auto& item : items) body_ += "- " + item + "\n";
    body_ += "\n";
}

void ReportEngine::addCodeBlock(const std::string& language, const std::string& code) {
    body_ += "```" + language + "\n" + code;
    if (code.empty() || code.back() != '\n') body_ += "\n";
    body_ += "```\n\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    if (!title.empty()) body_ += "### " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    appendMarkdownTable(body_, headers, rows);
}

void ReportEngine::addImage(const std::string& title, const std::string& imagePath) {
    body_ += "### " + title + "\n";
    body_ += "![" + title + "](" + imagePath + ")\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    std::error_code ec;
    const std::filesystem::path reportDir = std::filesystem::path(filePath).parent_path().empty()
        ? std::filesystem::current_path(ec)
        : std::filesystem::absolute(std::filesystem::path(filePath).parent_path(), ec);

    std::ofstream out(filePath);
    if (!out) throw Augur::IOException("Cannot open report for writing: " + filePath);
    out << normalizeImageLinks(body_, reportDir);
    if (!out.good()) throw Augur::IOException("Failed while writing report: " + filePath);
}
