#pragma once

#include <string>
#include <string_view>

namespace chordkit::i18n
{
// Layout direction lookups backed by ICU locale data.
//
// Display titles are supplied by the host already localized; this module only
// answers whether horizontal shortcuts should mirror.

// ICU's default locale name (e.g. "en_US").
std::string DefaultLocale();

// True when `locale` is written right-to-left (ar, he, fa, ur, ...).
// An empty string means ICU's default locale.
bool IsRightToLeft(std::string_view locale);

} // namespace chordkit::i18n
