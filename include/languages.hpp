//
//  languages.hpp
//  SubForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string_view>
#include <vector>

namespace subforge {

struct Language {
    const char *code;         ///< ISO 639 code used in export file names
    const char *name;         ///< English name
    const char *native_name;  ///< Endonym, UTF-8
};

inline constexpr const char *kDefaultLanguage = "hi";

// Languages offered for subtitle tracks, in menu order.
const std::vector<Language> &supported_languages();

// nullptr for codes not in the table.
const Language *find_language(std::string_view code);

}  // namespace subforge
