#ifndef __SB_JSON_PAYLOAD__
#define __SB_JSON_PAYLOAD__

#include "Headers.hpp"

namespace sb {
/**
 * @brief Helpers that write the report document by hand.
 *
 * The collection server expects a very specific encoding (bare numbers for
 * some values, quoted strings for the rest, and a fixed escaping table), so
 * the report is not produced by a generic JSON serializer.
 */

/**
 * @brief Wraps `text` in double quotes and escapes it.
 *
 * `"` and `\` get a backslash, backspace/tab/newline/carriage return use
 * their two character escapes and any other byte below 0x20 becomes
 * `\u00xx`.  Everything else is copied verbatim.
 */
string escapeJson(const string& text);

/**
 * @brief Returns true if `value` is written without quotes.
 *
 * A value is bare when it is "0" or does not end in '0', and it parses as a
 * floating point number.  Multi digit values ending in zero ("10", "1.0")
 * are therefore quoted.
 */
bool isNumericLiteral(const string& value);

/**
 * @brief Returns true if `value` is a floating point literal as the
 * collection server reads them: surrounding control characters ignored,
 * optional sign, `NaN`, `Infinity`, decimal or hex digits with an optional
 * exponent and an optional `f`/`F`/`d`/`D` suffix.
 */
bool parsesAsDouble(const string& value);

/**
 * @brief Appends `"key":value` to an object that is being written.
 *
 * A separating comma is added unless the object was just opened.
 */
void appendJsonPair(string* json, const string& key, const string& value);
}  // namespace sb

#endif  // __SB_JSON_PAYLOAD__
