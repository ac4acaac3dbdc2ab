#include <gtest/gtest.h>

#include "risk_classifier.hpp"

using aegis::ModelProfile;
using aegis::RiskTier;

TEST(RiskClassifier, CanonicalNameLowersAndUnderscores) {
    EXPECT_EQ(aegis::canonical_class_name("Armored Vehicle"), "armored_vehicle");
    EXPECT_EQ(aegis::canonical_class_name("tank"), "tank");
    EXPECT_EQ(aegis::canonical_class_name("large-vehicle"), "large-vehicle");
}

TEST(RiskClassifier, MilitaryVocabulary) {
    auto v = aegis::vocabulary_for(ModelProfile::MILITARY);
    EXPECT_EQ(aegis::classify("tank", v), RiskTier::HIGH);
    EXPECT_EQ(aegis::classify("Fighter Jet", v), RiskTier::HIGH);
    EXPECT_EQ(aegis::classify("military_truck", v), RiskTier::MEDIUM);
    EXPECT_EQ(aegis::classify("Radar Station", v), RiskTier::MEDIUM);
    EXPECT_EQ(aegis::classify("car", v), RiskTier::LOW);
}

TEST(RiskClassifier, DotaVocabularyKeepsHyphens) {
    auto v = aegis::vocabulary_for(ModelProfile::DOTA);
    EXPECT_EQ(aegis::classify("large-vehicle", v), RiskTier::HIGH);
    EXPECT_EQ(aegis::classify("small-vehicle", v), RiskTier::MEDIUM);
    EXPECT_EQ(aegis::classify("tank", v), RiskTier::LOW);
}

TEST(RiskClassifier, CocoAndAutoShareVocabulary) {
    auto coco = aegis::vocabulary_for(ModelProfile::COCO);
    auto autov = aegis::vocabulary_for(ModelProfile::AUTO);
    for (const char* name : {"truck", "person", "dog", "Airplane", "cell phone"}) {
        EXPECT_EQ(aegis::classify(name, coco), aegis::classify(name, autov)) << name;
    }
    EXPECT_EQ(aegis::classify("Airplane", coco), RiskTier::HIGH);
    EXPECT_EQ(aegis::classify("person", coco), RiskTier::MEDIUM);
    EXPECT_EQ(aegis::classify("dog", coco), RiskTier::LOW);
}

TEST(RiskClassifier, EmptyAndUnknownNamesAreLow) {
    auto v = aegis::vocabulary_for(ModelProfile::MILITARY);
    EXPECT_EQ(aegis::classify("", v), RiskTier::LOW);
    EXPECT_EQ(aegis::classify("class_42", v), RiskTier::LOW);
}
