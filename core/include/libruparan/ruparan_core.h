/********************************************************************
 * ruparan-core.h  –  ruparan core header
 ********************************************************************
Copyright (C) <2025> <Khumnath Cg/nath.khum@gmail.com>

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program. If not, see <https://www.gnu.org/licenses/>
 *******************************************************************/
#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <unicode/uversion.h>

// Forward declare ICU's UnicodeString to avoid including the full ICU header
namespace U_ICU_NAMESPACE {
class UnicodeString;
}

// =============================================================================//
// Data Types
// =============================================================================//

/// One legacy glyph sequence and the Unicode text it stands for (both UTF-8).
struct MappingRule {
    std::string legacy;
    std::string unicode;
};

/**
 * @brief The vowel sign that the legacy font types before its consonant.
 *
 * Whenever @c marker is followed by another character, the pair is rewritten
 * as that character followed by @c vowelSign.
 */
struct ReorderRule {
    char32_t marker = U'f';
    char32_t vowelSign = 0x093F; // DEVANAGARI VOWEL SIGN I
};

/// A codepoint left in converted text that lies outside the accepted ranges.
struct Residual {
    char32_t codepoint = 0;
    std::size_t count = 0;      ///< Occurrences in the converted text.
    std::size_t firstIndex = 0; ///< Codepoint index of the first occurrence.
};

/**
 * @brief The outcome of one conversion call.
 *
 * @c residuals is sorted by codepoint. An empty list means every character
 * of the output is Devanagari, Gurmukhi, printable ASCII or whitespace.
 */
struct ConversionResult {
    std::string text;
    std::vector<Residual> residuals;

    bool clean() const { return residuals.empty(); }
};

// =============================================================================//
// Standalone Functions
// =============================================================================//

/**
 * @brief Gets the version string of the libruparan library.
 * @return A string in "MAJOR.MINOR.PATCH" format.
 */
std::string getRuparanVersion();

/**
 * @brief Checks a codepoint against the ranges converted text may contain.
 *
 * Accepted are the Devanagari block (U+0900-U+097F, dandas included), the
 * Gurmukhi block (U+0A00-U+0A7F), printable ASCII (U+0020-U+007E) and every
 * White_Space codepoint.
 */
bool isAcceptedCodepoint(char32_t c);

/**
 * @brief Scans converted text for codepoints that were not converted.
 * @param text UTF-8 text, normally the output of the conversion passes.
 * @param marker The reorder marker. A surviving marker is always reported,
 * even though it is printable ASCII.
 * @return Distinct offending codepoints sorted by value, with counts.
 */
std::vector<Residual> findResiduals(const std::string& text, char32_t marker = U'f');

/** @brief Formats a codepoint as "U+0915" (at least four hex digits). */
std::string formatCodepoint(char32_t c);

/** @brief Encodes a single codepoint as UTF-8. */
std::string codepointToUtf8(char32_t c);


// =============================================================================//
// MappingTable Class
// =============================================================================//
/**
 * @brief An immutable, ordered set of legacy -> Unicode substitution rules.
 *
 * Rules are kept in application order: longest key (in codepoints) first,
 * keys of equal length in declaration order.
 */
class MappingTable {
public:
    /// Multi-unit keys have two or more codepoints, single-unit keys exactly one.
    enum Kind { MultiUnit = 0, SingleUnit = 1 };

    /**
     * @brief Validates and orders the rules.
     * @throws std::runtime_error on an empty key, a key whose length does not
     * fit @p kind, malformed UTF-8, or a key declared twice.
     */
    MappingTable(Kind kind, std::vector<MappingRule> rules);
    ~MappingTable();

    MappingTable(const MappingTable& other);
    MappingTable& operator=(const MappingTable& other);
    MappingTable(MappingTable&& other) noexcept;
    MappingTable& operator=(MappingTable&& other) noexcept;

    Kind kind() const;

    /** @brief All rules, in the order they are applied. */
    const std::vector<MappingRule>& rules() const;
    std::size_t size() const;

    bool contains(const std::string& legacy) const;

    /**
     * @brief Looks up the replacement for a legacy key.
     * @return The Unicode replacement, or an empty string if the key is absent.
     */
    std::string lookup(const std::string& legacy) const;

    /**
     * @brief Rewrites @p text in place with every rule, one after another.
     *
     * Each rule replaces all non-overlapping occurrences from left to right,
     * and the next rule scans the result, including text that an earlier
     * rule produced.
     */
    void applyTo(U_ICU_NAMESPACE::UnicodeString& text) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/// The complete contents of a mapping data file.
struct MappingSet {
    MappingTable multiUnit;
    MappingTable singleUnit;
    ReorderRule reorder;
};

/**
 * @brief Parses mapping data in the libruparan TOML subset.
 *
 * Sections [multiUnit] and [singleUnit] hold "key" = "value" lines, [reorder]
 * holds `marker` and `vowelSign`. Strings accept the \" \\ \n \t and \uXXXX
 * escapes. Unknown sections are skipped.
 *
 * @param content The file contents.
 * @param sourceName Used to prefix error messages ("mapping.toml:12: ...").
 * @throws std::runtime_error on malformed lines or invalid tables.
 */
MappingSet parseMappingToml(const std::string& content, const std::string& sourceName = "mapping.toml");

/**
 * @brief Reads and parses a mapping data file.
 * @throws std::runtime_error if the file is missing, unreadable or invalid.
 */
MappingSet loadMappingFile(const std::string& path);


// =============================================================================//
// LegacyFontConverter Class
// =============================================================================//
/**
 * @brief Converts Kruti Dev / DV-TT legacy font text into Unicode Devanagari.
 *
 * Substitution runs the multi-unit table before the single-unit table. The
 * short-i reordering pass follows, and the result is scanned for characters
 * that could not be converted. The tables never change after construction,
 * so one converter can be shared between threads.
 */
class LegacyFontConverter {
public:
    /**
     * @brief Constructs the converter and loads mapping.toml.
     * @param dataDir Optional path to the directory containing mapping.toml.
     * If empty, /usr/share/libruparan/ and then /usr/local/share/libruparan/
     * are used.
     * @throws std::runtime_error if the mapping file cannot be loaded.
     */
    explicit LegacyFontConverter(const std::string& dataDir = "");

    /** @brief Constructs the converter from tables built by the caller. */
    LegacyFontConverter(MappingTable multiUnit, MappingTable singleUnit, ReorderRule reorder = ReorderRule());

    ~LegacyFontConverter();

    /**
     * @brief Converts legacy font text to Unicode.
     *
     * Never throws for any input. Characters without a mapping are passed
     * through unchanged and listed in ConversionResult::residuals.
     *
     * @param input UTF-8 encoded legacy text.
     */
    ConversionResult convert(const std::string& input) const;

    /** @brief Runs only the two substitution passes. */
    std::string substitute(const std::string& input) const;

    /** @brief Runs only the short-i reordering pass. */
    std::string reorder(const std::string& input) const;

    const MappingTable& multiUnitTable() const;
    const MappingTable& singleUnitTable() const;
    const ReorderRule& reorderRule() const;

    /** @brief The directory mapping.toml was loaded from (empty if built from tables). */
    std::string dataDir() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};


#ifdef HAVE_SQLITE3

// =============================================================================//
// ResidualLedger Class
// =============================================================================//
/**
 * @brief Collects unconverted codepoints across conversion runs in SQLite.
 *
 * Used while converting a new corpus to find out which legacy glyphs still
 * lack a mapping, and how often they occur.
 */
class ResidualLedger {
public:
    /// One stored residual codepoint.
    struct Entry {
        char32_t codepoint = 0;
        long frequency = 0;
        std::string firstSource;
    };

    /**
     * @brief Constructs the ledger and opens the database connection.
     * @param dbPath Optional path to the database file. If empty, a default
     * platform-specific path (e.g., in XDG_DATA_HOME) is used.
     */
    explicit ResidualLedger(const std::string& dbPath = "");

    /**
     * @brief Destroys the ledger and closes the database connection.
     */
    ~ResidualLedger();

    /**
     * @brief Deletes ALL recorded residuals. This action cannot be undone.
     */
    void reset();

    /**
     * @brief Retrieves metadata about the current database.
     * @return A map containing info like "entry_count", "db_path", etc.
     */
    std::map<std::string, std::string> getDatabaseInfo();

    /**
     * @brief Adds the residuals of one conversion to the ledger.
     * @param result The conversion result to record.
     * @param source Where the text came from (file name and line, "argv", ...).
     * Only stored for codepoints seen for the first time.
     */
    void record(const ConversionResult& result, const std::string& source);

    /**
     * @brief Gets the accumulated frequency of a codepoint.
     * @return The frequency, or -1 if the codepoint was never recorded.
     */
    long getFrequency(char32_t codepoint);

    /**
     * @brief Converts a text file line by line and records every residual.
     * @param filePath The path to the UTF-8 encoded legacy text file.
     * @param converter The converter to run.
     * @return The number of lines that produced at least one residual.
     */
    long recordFromFile(const std::string& filePath, const LegacyFontConverter& converter);

    /// Defines the columns available for sorting database queries.
    enum SortColumn { ByCodepoint = 0, ByFrequency = 1 };

    /**
     * @brief Retrieves recorded residuals with pagination and sorting.
     * @param limit The maximum number of entries per page (-1 for all).
     * @param offset The starting position for the query (for pagination).
     */
    std::vector<Entry> getAll(int limit = -1, int offset = 0, SortColumn sortBy = ByFrequency, bool ascending = false);

    /** @brief Starts a database transaction for efficient bulk operations. */
    void beginTransaction();
    /** @brief Commits the current database transaction. */
    void commitTransaction();
    /** @brief Rolls back the current database transaction. */
    void rollbackTransaction();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};
#endif
