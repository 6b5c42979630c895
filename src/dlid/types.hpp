#pragma once
// Purpose: DL/ID parse result shapes (header, subfile directory, subfile records).

#include <string>
#include <vector>
#include <map>

namespace dlid {

struct Header {
    std::string data_element_separator;
    std::string record_separator;
    std::string segment_terminator;
    std::string iin;                  // issuer identification number
    std::string aamva_version;
    std::string jurisdiction_version;
    int num_entries = 0;
};

struct SubfileDesignator {
    std::string type;  // "DL", "ID", "ZV", ...
    int offset = 0;
    int length = 0;
};

// record key ("DAQ") -> value
using SubfileData = std::map<std::string, std::string>;

// subfile type -> records; only recognized types are present
using Subfiles = std::map<std::string, SubfileData>;

struct ParseResult {
    Header header;
    std::vector<SubfileDesignator> subfile_designators;
    Subfiles subfiles;
};

inline bool operator==(const Header& a, const Header& b) {
    return a.data_element_separator == b.data_element_separator &&
           a.record_separator == b.record_separator &&
           a.segment_terminator == b.segment_terminator &&
           a.iin == b.iin &&
           a.aamva_version == b.aamva_version &&
           a.jurisdiction_version == b.jurisdiction_version &&
           a.num_entries == b.num_entries;
}

inline bool operator==(const SubfileDesignator& a, const SubfileDesignator& b) {
    return a.type == b.type && a.offset == b.offset && a.length == b.length;
}

inline bool operator==(const ParseResult& a, const ParseResult& b) {
    return a.header == b.header &&
           a.subfile_designators == b.subfile_designators &&
           a.subfiles == b.subfiles;
}

inline bool operator!=(const ParseResult& a, const ParseResult& b) { return !(a == b); }

} // namespace dlid
