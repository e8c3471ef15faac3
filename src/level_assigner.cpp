#include "level_assigner.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <utility>

const char* heading_level_name(Heading_Level level) {
    switch (level) {
        case Heading_Level::H1: return "H1";
        case Heading_Level::H2: return "H2";
        case Heading_Level::H3: return "H3";
    }
    return "H3";
}

namespace {

bool same_position(const PDF_Fragment& a, const PDF_Fragment& b) {
    return a.page == b.page &&
           std::fabs(a.x - b.x) < PDF_OUTLINE_DUPLICATE_POSITION_DELTA &&
           std::fabs(a.y - b.y) < PDF_OUTLINE_DUPLICATE_POSITION_DELTA;
}

} // namespace

std::vector<PDF_Outline_Entry> assign_levels(const std::vector<PDF_Heading_Candidate>& candidates, const Outline_Configuration& config) {
    std::vector<PDF_Outline_Entry> outline;
    if (candidates.empty()) {
        return outline;
    }

    std::vector<const PDF_Heading_Candidate*> in_document_order;
    in_document_order.reserve(candidates.size());
    for (const PDF_Heading_Candidate& candidate : candidates) {
        in_document_order.push_back(&candidate);
    }
    std::sort(in_document_order.begin(), in_document_order.end(),
              [](const PDF_Heading_Candidate* a, const PDF_Heading_Candidate* b) { return a->order < b->order; });

    std::vector<const PDF_Heading_Candidate*> kept;
    std::set<std::pair<unsigned int, std::string>> seen_texts;
    for (const PDF_Heading_Candidate* candidate : in_document_order) {
        bool duplicate = std::any_of(kept.begin(), kept.end(), [candidate](const PDF_Heading_Candidate* other) {
            return same_position(other->fragment, candidate->fragment);
        });
        if (duplicate) {
            LOG_CHANNEL_TRACE("levels") << "Dropping overlapping duplicate '" << candidate->fragment.text
                                        << "' on page " << candidate->fragment.page;
            continue;
        }

        if (config.merge_repeated_headings &&
            !seen_texts.emplace(candidate->fragment.page, to_lower_copy(candidate->fragment.text)).second) {
            LOG_CHANNEL_TRACE("levels") << "Dropping repeated heading '" << candidate->fragment.text
                                        << "' on page " << candidate->fragment.page;
            continue;
        }

        kept.push_back(candidate);
    }

    // size ranks are bucket indices in descending size order
    std::set<std::size_t> ranks;
    for (const PDF_Heading_Candidate* candidate : kept) {
        ranks.insert(candidate->size_rank);
    }
    std::map<std::size_t, Heading_Level> level_of_rank;
    unsigned int position = 0;
    for (std::size_t rank : ranks) {
        unsigned int level = std::min(position + 1, config.max_levels);
        level_of_rank[rank] = static_cast<Heading_Level>(level);
        ++position;
    }

    for (const PDF_Heading_Candidate* candidate : kept) {
        PDF_Outline_Entry entry;
        entry.level = level_of_rank[candidate->size_rank];
        entry.text = candidate->fragment.text;
        entry.page = candidate->fragment.page;
        entry.font_size = candidate->fragment.font_size;
        entry.y = candidate->fragment.y;
        outline.push_back(std::move(entry));
    }

    // kept is in document order, so stability breaks position ties by it
    std::stable_sort(outline.begin(), outline.end(), [](const PDF_Outline_Entry& a, const PDF_Outline_Entry& b) {
        if (a.page != b.page) return a.page < b.page;
        return a.y < b.y;
    });

    LOG_CHANNEL_DEBUG("levels") << outline.size() << " outline entr" << (outline.size() == 1 ? "y" : "ies")
                                << " across " << ranks.size() << " size bucket(s)";
    return outline;
}
