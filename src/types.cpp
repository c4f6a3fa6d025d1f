#include "capbox/types.hpp"

namespace capbox {

const std::array<const char*, NUM_FEATURES> FEATURE_NAMES = {
    // Spatial (0-6)
    "topAlignment",
    "bottomAlignment",
    "heightSimilarity",
    "horizontalClustering",
    "aspectRatio",
    "normalizedY",
    "normalizedArea",
    // User annotations (7-8)
    "isUserAnnotatedIn",
    "isUserAnnotatedOut",
    // Edge positions (9-12)
    "normalizedLeft",
    "normalizedTop",
    "normalizedRight",
    "normalizedBottom",
    // Character sets (13-23)
    "isRoman",
    "isHanzi",
    "isArabic",
    "isKorean",
    "isHiragana",
    "isKatakana",
    "isCyrillic",
    "isDevanagari",
    "isThai",
    "isDigits",
    "isPunctuation",
    // Temporal (24-25)
    "timeFromStart",
    "timeFromEnd",
};

std::optional<Label> parse_label(const std::string& text) {
    if (text == "in") return Label::IN;
    if (text == "out") return Label::OUT;
    return std::nullopt;
}

}  // namespace capbox
