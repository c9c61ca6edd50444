//
//  languages.cpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "languages.hpp"

namespace subforge {

const std::vector<Language> &supported_languages() {
    static const std::vector<Language> kLanguages = {
        {"hi", "Hindi", "हिन्दी"},
        {"or", "Odia", "ଓଡ଼ିଆ"},
        {"ne", "Nepali", "नेपाली"},
        {"gbm", "Garhwali", "गढ़वाली"},
        {"jns", "Jaunsari", "जौनसारी"},
        {"rnp", "Rongpo", "Rongpo"},
        {"kfy", "Kumaoni", "कुमाऊँनी"},
        {"gbj", "Gutob", "Gutob"},
        {"srb", "Sora", "Sora"},
        {"juy", "Juray", "Juray"},
        {"rji", "Raji", "Raji"},
        {"thq", "Kochila Tharu", "Kochila Tharu"},
        {"en", "English", "English"},
        {"bn", "Bengali", "বাংলা"},
        {"te", "Telugu", "తెలుగు"},
        {"ta", "Tamil", "தமிழ்"},
        {"kn", "Kannada", "ಕನ್ನಡ"},
        {"ml", "Malayalam", "മലയാളം"},
        {"gu", "Gujarati", "ગુજરાતી"},
        {"pa", "Punjabi", "ਪੰਜਾਬੀ"},
        {"ur", "Urdu", "اردو"},
        {"as", "Assamese", "অসমীয়া"},
        {"mr", "Marathi", "मराठी"},
    };
    return kLanguages;
}

const Language *find_language(std::string_view code) {
    for (const auto &lang : supported_languages()) {
        if (code == lang.code) {
            return &lang;
        }
    }
    return nullptr;
}

}  // namespace subforge
