#include "text.h"
#include <cctype>
#include <cstring>

namespace tvscout {

bool copyString(char* dest, size_t destLen, const char* src) {
    if (dest == nullptr || destLen == 0) return false;
    if (src == nullptr) {
        dest[0] = '\0';
        return true;
    }

    size_t len = strlen(src);
    bool fits = len < destLen;
    if (!fits) len = destLen - 1;
    memcpy(dest, src, len);
    dest[len] = '\0';
    return fits;
}

size_t copyTrimmed(char* dest, size_t destLen, const char* src, size_t srcLen) {
    if (dest == nullptr || destLen == 0) return 0;
    dest[0] = '\0';
    if (src == nullptr) return 0;

    size_t start = 0;
    while (start < srcLen && isspace((unsigned char)src[start])) start++;
    size_t end = srcLen;
    while (end > start && isspace((unsigned char)src[end - 1])) end--;

    size_t len = end - start;
    if (len >= destLen) len = destLen - 1;
    memcpy(dest, src + start, len);
    dest[len] = '\0';
    return len;
}

bool equalsNoCase(const char* a, const char* b) {
    if (a == nullptr || b == nullptr) return false;
    while (*a && *b) {
        if (tolower((unsigned char)*a) != tolower((unsigned char)*b)) return false;
        a++;
        b++;
    }
    return *a == *b;
}

bool containsNoCase(const char* haystack, const char* needle) {
    if (haystack == nullptr || needle == nullptr) return false;
    size_t needleLen = strlen(needle);
    if (needleLen == 0) return true;

    for (const char* h = haystack; *h; h++) {
        size_t i = 0;
        while (i < needleLen && h[i] &&
               tolower((unsigned char)h[i]) == tolower((unsigned char)needle[i])) {
            i++;
        }
        if (i == needleLen) return true;
    }
    return false;
}

bool startsWith(const char* s, const char* prefix) {
    if (s == nullptr || prefix == nullptr) return false;
    return strncmp(s, prefix, strlen(prefix)) == 0;
}

void toLowerInPlace(char* s) {
    if (s == nullptr) return;
    for (; *s; s++) *s = (char)tolower((unsigned char)*s);
}

void toUpperInPlace(char* s) {
    if (s == nullptr) return;
    for (; *s; s++) *s = (char)toupper((unsigned char)*s);
}

bool isValidIpv4(const char* s) {
    if (s == nullptr) return false;

    int octets = 0;
    const char* p = s;
    while (true) {
        if (!isdigit((unsigned char)*p)) return false;
        int value = 0;
        int digits = 0;
        while (isdigit((unsigned char)*p)) {
            value = value * 10 + (*p - '0');
            digits++;
            p++;
            if (digits > 3) return false;
        }
        if (value > 255) return false;
        octets++;

        if (*p == '\0') break;
        if (*p != '.' || octets == 4) return false;
        p++;
    }
    return octets == 4;
}

} // namespace tvscout
