#pragma once
#include <string>
#include <vector>

class ReportEngine {
public:
    void addTitle(const std::string& title);
    void addHeading(const std::string& heading, int level = 2);
    void addParagraph(const std::string& text);
    void addBulletList(const std::vector<std::string>& items, const std::string& emptyPlaceholder = "(none)");
    void addCodeBlock(const std::string& language, const std::string& code);
    void addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows);
    void addImage(const std::string& title, const std::string& imagePath);

    const std::string& markdown() const noexcept { return body_; }

    /**
     * @brief Writes the report; local image links become relative to the report's directory.
     * @throws Augur::IOException when the file cannot be written.
     */
    void save(const std::string& filePath) const;

private:
    std::string body_;
};
