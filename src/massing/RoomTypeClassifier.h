#pragma once

// Keyword-based room type detection from free-text room names
// English, Portuguese and Spanish synonyms; accents are folded before matching

#include "RoomType.h"
#include <string>
#include <vector>

namespace massing {

// Keywords for one room type, in normalized form
struct KeywordRule {
    RoomType type;
    std::vector<std::string> keywords;
};

class RoomTypeClassifier {
public:
    // First keyword hit wins, rules evaluated in priority order.
    // Never fails: names without a hit are Unclassified.
    static RoomType classify(const std::string& name);

    // Lowercase, fold Latin accents, turn punctuation into single spaces
    static std::string normalize(const std::string& name);

    // Rules in evaluation order (circulation first)
    static const std::vector<KeywordRule>& rules();
};

} // namespace massing
