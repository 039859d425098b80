#include <kreuzberg/processing/page_splitter.h>

#include <spdlog/spdlog.h>

namespace kreuzberg::processing {

std::string formatPageMarker(std::string_view markerFormat, std::size_t pageNumber) {
    static constexpr std::string_view kPlaceholder = "{page_num}";
    std::string out;
    out.reserve(markerFormat.size() + 8);
    std::size_t pos = 0;
    while (pos < markerFormat.size()) {
        auto at = markerFormat.find(kPlaceholder, pos);
        if (at == std::string_view::npos) {
            out.append(markerFormat.substr(pos));
            break;
        }
        out.append(markerFormat.substr(pos, at - pos));
        out += std::to_string(pageNumber);
        pos = at + kPlaceholder.size();
    }
    return out;
}

std::vector<extraction::PageContent> splitPages(std::string_view content) {
    std::vector<extraction::PageContent> pages;
    std::size_t start = 0;
    std::size_t number = 1;
    while (true) {
        auto ff = content.find('\f', start);
        extraction::PageContent page;
        page.page_number = number++;
        page.content = std::string(content.substr(start, ff == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : ff - start));
        pages.push_back(std::move(page));
        if (ff == std::string_view::npos)
            break;
        start = ff + 1;
    }
    return pages;
}

void applyPageConfig(extraction::ExtractionResult& result, const config::PageConfig& config) {
    std::vector<extraction::PageContent> pages;
    if (result.pages && !result.pages->empty())
        pages = *result.pages;
    else
        pages = splitPages(result.content);

    for (auto& page : pages) {
        page.tables.clear();
        for (const auto& table : result.tables) {
            if (table.page_number == page.page_number)
                page.tables.push_back(table);
        }
    }

    extraction::PageStructure structure;
    structure.total_count = pages.size();
    std::string content;
    for (std::size_t i = 0; i < pages.size(); ++i) {
        if (config.insert_page_markers) {
            content += formatPageMarker(config.marker_format, pages[i].page_number);
        } else if (i > 0) {
            content += "\n\n";
        }
        extraction::PageBoundary boundary;
        boundary.page_number = pages[i].page_number;
        boundary.byte_start = content.size();
        content += pages[i].content;
        boundary.byte_end = content.size();
        structure.boundaries.push_back(boundary);
    }

    // A single page without markers keeps the content byte-identical
    if (pages.size() > 1 || config.insert_page_markers)
        result.content = std::move(content);

    result.metadata["page_count"] = pages.size();
    result.page_structure = std::move(structure);
    if (config.extract_pages)
        result.pages = std::move(pages);
    else
        result.pages.reset();

    spdlog::debug("Page split: {} pages (markers={}, extract={})", result.page_structure->total_count,
                  config.insert_page_markers, config.extract_pages);
}

} // namespace kreuzberg::processing
