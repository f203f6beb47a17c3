#include "oui_table.h"
#include <cctype>
#include <cstring>

namespace tvscout {

// Major TV/AV vendors only; IEEE registry plus prefixes seen on real sets
static const OuiEntry OUI_ENTRIES[] = {
    // Samsung Electronics
    {"4844F7", "Samsung"}, {"606BBD", "Samsung"}, {"641CB0", "Samsung"},
    {"8CC8CD", "Samsung"}, {"8CEA48", "Samsung"}, {"F47B5E", "Samsung"},
    {"F4F5D8", "Samsung"}, {"8C771F", "Samsung"}, {"DCA6B2", "Samsung"},
    {"78BD06", "Samsung"}, {"B03CF9", "Samsung"}, {"78F7BE", "Samsung"},
    {"A8F274", "Samsung"}, {"000DE2", "Samsung"}, {"0018AF", "Samsung"},
    {"002339", "Samsung"}, {"6C2F2C", "Samsung"},

    // LG Electronics
    {"A4C3F0", "LG Electronics"}, {"CC2D8C", "LG Electronics"}, {"7823AE", "LG Electronics"},
    {"001E75", "LG Electronics"}, {"B8AD28", "LG Electronics"}, {"5C4972", "LG Electronics"},
    {"E8D8C6", "LG Electronics"}, {"8C3BAD", "LG Electronics"}, {"F44701", "LG Electronics"},
    {"34DF2A", "LG Electronics"}, {"C4360C", "LG Electronics"},

    // Sony
    {"0013A9", "Sony"}, {"001A80", "Sony"}, {"0024BE", "Sony"},
    {"AC9B0A", "Sony"}, {"F0BF97", "Sony"}, {"54420F", "Sony"},
    {"28FD80", "Sony"}, {"3CEAEB", "Sony"}, {"A8E063", "Sony"},
    {"FCF152", "Sony"},

    // Philips / TP Vision
    {"00178F", "Philips"}, {"000FDC", "Philips"}, {"ACC723", "Philips"},
    {"E8D4B1", "Philips"}, {"246078", "Philips"},

    {"E4B021", "Hisense"}, {"10F681", "Hisense"}, {"4CEEAD", "Hisense"},
    {"C4006F", "Hisense"}, {"2C0E3D", "Hisense"},

    {"500791", "TCL"}, {"E04F43", "TCL"}, {"8CFAB5", "TCL"}, {"14C1EB", "TCL"},

    {"00080D", "Panasonic"}, {"000DAE", "Panasonic"}, {"001B50", "Panasonic"},
    {"002697", "Panasonic"}, {"ACB57D", "Panasonic"}, {"3C2AF4", "Panasonic"},

    {"00166B", "Sharp"}, {"001AB2", "Sharp"}, {"6C5AB5", "Sharp"},

    {"000039", "Toshiba"}, {"001BB1", "Toshiba"}, {"5CF370", "Toshiba"},

    // Chromecast, Android TV dongles
    {"54609E", "Google"}, {"F4F5E8", "Google"}, {"1C1AC0", "Google"},
    {"48D705", "Google"}, {"A4C138", "Google"}, {"E0D55E", "Google"},

    // Fire TV
    {"FC65DE", "Amazon"}, {"40B4CD", "Amazon"}, {"74C246", "Amazon"},
    {"0C47C9", "Amazon"}, {"A002DC", "Amazon"},

    {"3C0754", "Apple"}, {"7CD1C3", "Apple"}, {"A4B197", "Apple"},
    {"8C2DAA", "Apple"}, {"F0DCE2", "Apple"},

    {"B0A737", "Roku"}, {"D4E26E", "Roku"}, {"00EE85", "Roku"},
    {"C83A35", "Roku"}, {"D0564C", "Roku"},
};

static const int NUM_OUI_ENTRIES = sizeof(OUI_ENTRIES) / sizeof(OUI_ENTRIES[0]);

bool ouiPrefix(const char* mac, char* prefix, size_t prefixLen) {
    if (mac == nullptr || prefix == nullptr || prefixLen < 7) return false;

    size_t digits = 0;
    for (const char* p = mac; *p != '\0' && digits < 6; p++) {
        if (isxdigit((unsigned char)*p)) {
            prefix[digits++] = (char)toupper((unsigned char)*p);
        }
    }
    prefix[digits] = '\0';
    return digits == 6;
}

const char* lookupOuiVendor(const char* mac) {
    char prefix[7];
    if (!ouiPrefix(mac, prefix, sizeof(prefix))) return nullptr;

    for (int i = 0; i < NUM_OUI_ENTRIES; i++) {
        if (strcmp(OUI_ENTRIES[i].prefix, prefix) == 0) {
            return OUI_ENTRIES[i].vendor;
        }
    }
    return nullptr;
}

const OuiEntry* getOuiEntries(int& count) {
    count = NUM_OUI_ENTRIES;
    return OUI_ENTRIES;
}

} // namespace tvscout
