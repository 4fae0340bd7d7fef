#include "core/i18n.h"

#include <unicode/locid.h>

namespace chordkit::i18n
{
std::string DefaultLocale()
{
    const icu::Locale& loc = icu::Locale::getDefault();
    const char* name = loc.getName();
    return name ? std::string(name) : std::string();
}

bool IsRightToLeft(std::string_view locale)
{
    if (locale.empty())
        return icu::Locale::getDefault().isRightToLeft() != 0;

    // Accept BCP47 tags ("ar-EG") as well as ICU ids ("ar_EG").
    const std::string id(locale);
    const icu::Locale loc = icu::Locale::createCanonical(id.c_str());
    if (loc.isBogus())
        return false;
    return loc.isRightToLeft() != 0;
}

} // namespace chordkit::i18n
