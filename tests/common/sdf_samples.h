// SD-file fragments shared by the ingest, extraction and CLI tests

#pragma once

#include <string>

namespace pubmirror::test {

/**
 * @brief A minimal one-atom record with the given CID and optional SMILES/fingerprint.
 */
inline std::string sdfRecord(const std::string& cid, const std::string& smiles = "",
                             const std::string& fingerprint = "") {
    std::string r;
    r += cid + "\n";
    r += "  -OEChem-01012400002D\n";
    r += "\n";
    r += "  1  0  0     0  0  0  0  0  0999 V2000\n";
    r += "    0.0000    0.0000    0.0000 C   0  0  0  0  0  0  0  0  0  0  0  0\n";
    r += "M  END\n";
    r += "> <PUBCHEM_COMPOUND_CID>\n" + cid + "\n\n";
    if (!smiles.empty())
        r += "> <PUBCHEM_SMILES>\n" + smiles + "\n\n";
    if (!fingerprint.empty())
        r += "> <PUBCHEM_CACTVS_SUBSKEYS>\n" + fingerprint + "\n\n";
    r += "$$$$\n";
    return r;
}

/**
 * @brief A record whose molfile block never reaches "M  END".
 */
inline std::string malformedSdfRecord() {
    return "broken\n  -OEChem-\n\n  1  0  0     0  0  0  0  0  0999 V2000\n$$$$\n";
}

} // namespace pubmirror::test
