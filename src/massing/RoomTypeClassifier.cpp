#include "RoomTypeClassifier.h"
#include <cctype>

namespace massing {

namespace {

// Fold the second byte of a two-byte UTF-8 sequence led by 0xC3 (Latin-1 supplement).
// Returns 0 for characters we leave alone.
char foldLatin1(unsigned char c) {
    if (c >= 0x80 && c <= 0x85) return 'a';
    if (c == 0x87) return 'c';
    if (c >= 0x88 && c <= 0x8B) return 'e';
    if (c >= 0x8C && c <= 0x8F) return 'i';
    if (c == 0x91) return 'n';
    if (c >= 0x92 && c <= 0x96) return 'o';
    if (c >= 0x99 && c <= 0x9C) return 'u';
    if (c >= 0xA0 && c <= 0xA5) return 'a';
    if (c == 0xA7) return 'c';
    if (c >= 0xA8 && c <= 0xAB) return 'e';
    if (c >= 0xAC && c <= 0xAF) return 'i';
    if (c == 0xB1) return 'n';
    if (c >= 0xB2 && c <= 0xB6) return 'o';
    if (c >= 0xB9 && c <= 0xBC) return 'u';
    return 0;
}

} // namespace

std::string RoomTypeClassifier::normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pendingSpace = false;
    size_t wordLength = 0;

    auto emit = [&](char c) {
        if (pendingSpace && !out.empty()) {
            out.push_back(' ');
            wordLength = 0;
        }
        pendingSpace = false;
        out.push_back(c);
        ++wordLength;
    };

    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);

        if (c == 0xC3 && i + 1 < name.size()) {
            char folded = foldLatin1(static_cast<unsigned char>(name[i + 1]));
            if (folded != 0) {
                emit(folded);
                ++i;
                continue;
            }
        }

        if (c >= 0x80) {
            // Other multibyte text passes through untouched
            emit(static_cast<char>(c));
        } else if (std::isalnum(c)) {
            emit(static_cast<char>(std::tolower(c)));
        } else if (c == '.' && !pendingSpace && wordLength == 1 &&
                   std::isalpha(static_cast<unsigned char>(out.back()))) {
            // Dotted abbreviations: "W.C." reads as "wc"
            continue;
        } else {
            // Whitespace, punctuation, underscores and dashes all separate words
            pendingSpace = true;
        }
    }

    return out;
}

const std::vector<KeywordRule>& RoomTypeClassifier::rules() {
    static const std::vector<KeywordRule> kRules = {
        {RoomType::Circulation, {"hallway", "hall", "corridor", "corredor", "circulation",
                                 "circulacao", "circulacion", "pasillo", "entry", "entrance",
                                 "foyer", "vestibulo"}},
        {RoomType::Bathroom, {"bathroom", "bath", "wc", "toilet", "lavabo", "powder", "restroom",
                              "lavatory", "banheiro", "bano", "aseo"}},
        {RoomType::Kitchen, {"kitchen", "kitchenette", "cozinha", "cocina"}},
        {RoomType::Bedroom, {"bedroom", "bed", "quarto", "suite", "dormitorio", "master",
                             "habitacion", "recamara", "alcoba"}},
        {RoomType::Living, {"living", "sala", "family room", "lounge", "sitting", "dining",
                            "estar", "jantar", "comedor"}},
        {RoomType::Office, {"office", "home office", "study", "library", "escritorio", "estudio",
                            "oficina"}},
        {RoomType::Utility, {"storage", "closet", "laundry", "utility", "pantry", "garage",
                             "despensa", "lavanderia", "deposito", "almacen", "garagem"}},
    };
    return kRules;
}

RoomType RoomTypeClassifier::classify(const std::string& name) {
    const std::string normalized = normalize(name);
    if (normalized.empty()) {
        return RoomType::Unclassified;
    }

    for (const KeywordRule& rule : rules()) {
        for (const std::string& keyword : rule.keywords) {
            if (normalized.find(keyword) != std::string::npos) {
                return rule.type;
            }
        }
    }
    return RoomType::Unclassified;
}

} // namespace massing
