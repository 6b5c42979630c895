#pragma once
// Purpose: Descriptions of common AAMVA DL/ID data element IDs (presentation only).

#include <string>
#include <unordered_map>

namespace dlid {
namespace elements {

using Catalog = std::unordered_map<std::string, std::string>;

inline const Catalog& catalog() {
    static const Catalog c = {
        {"DCA", "Jurisdiction-specific vehicle class"},
        {"DCB", "Jurisdiction-specific restriction codes"},
        {"DCD", "Jurisdiction-specific endorsement codes"},
        {"DBA", "Document Expiration Date"},
        {"DCS", "Customer Family Name"},
        {"DAC", "Customer First Name"},
        {"DAD", "Customer Middle Name(s)"},
        {"DBD", "Document Issue Date"},
        {"DBB", "Date of Birth"},
        {"DBC", "Physical Description - Sex"},
        {"DAY", "Physical Description - Eye Color"},
        {"DAU", "Physical Description - Height"},
        {"DAG", "Address - Street 1"},
        {"DAH", "Address - Street 2"},
        {"DAI", "Address - City"},
        {"DAJ", "Address - Jurisdiction Code"},
        {"DAK", "Address - Postal Code"},
        {"DAQ", "Customer ID Number"},
        {"DCF", "Document Discriminator"},
        {"DCG", "Country Identification"},
        {"DDE", "Family name truncation"},
        {"DDF", "First name truncation"},
        {"DDG", "Middle name truncation"},
        {"DAZ", "Hair color"},
        {"DCI", "Place of birth"},
        {"DCJ", "Audit information"},
        {"DCK", "Inventory control number"},
        {"DBN", "Alias / AKA Family Name"},
        {"DBG", "Alias / AKA Given Name"},
        {"DBS", "Alias / AKA Suffix Name"},
        {"DCU", "Name Suffix"},
        {"DCE", "Physical Description - Weight Range"},
        {"DCL", "Race / ethnicity"},
        {"DCM", "Standard vehicle classification"},
        {"DCN", "Standard endorsement code"},
        {"DCO", "Standard restriction code"},
        {"DCP", "Jurisdiction-specific vehicle classification description"},
        {"DCQ", "Jurisdiction-specific endorsement code description"},
        {"DCR", "Jurisdiction-specific restriction code description"},
        {"DDA", "Compliance Type"},
        {"DDB", "Card Revision Date"},
        {"DDC", "HAZMAT Endorsement Expiration Date"},
        {"DDD", "Limited Duration Document Indicator"},
        {"DAW", "Weight (pounds)"},
        {"DAX", "Weight (kilograms)"},
        {"DDH", "Under 18 Until"},
        {"DDI", "Under 19 Until"},
        {"DDJ", "Under 21 Until"},
        {"DDK", "Organ Donor Indicator"},
        {"DDL", "Veteran Indicator"},
    };
    return c;
}

// Empty for keys outside the catalog (jurisdiction-specific elements included).
inline std::string describe(const std::string& key) {
    auto it = catalog().find(key);
    if (it == catalog().end()) return std::string();
    return it->second;
}

} // namespace elements
} // namespace dlid
