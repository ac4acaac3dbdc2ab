#include "risk_classifier.hpp"

#include <cctype>

namespace aegis {

std::string canonical_class_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == ' ') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

RiskTier classify(const std::string& class_name, const RiskVocabulary& vocabulary) {
    const std::string c = canonical_class_name(class_name);
    if (vocabulary.high.count(c)) return RiskTier::HIGH;
    if (vocabulary.medium.count(c)) return RiskTier::MEDIUM;
    return RiskTier::LOW;
}

}  // namespace aegis
