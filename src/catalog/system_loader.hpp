#pragma once

/// @file system_loader.hpp
/// @brief Loads star-system descriptions from CSV files and builds universes from them.

#include "core/types.hpp"
#include "universe/universe.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orrery::catalog
{
    /// @brief Kind column of a system CSV row.
    enum class RecordKind : u8
    {
        Body,        ///< "body"
        Star,        ///< "star"
        Planet,      ///< "planet"
        BlackHole,   ///< "black_hole"
    };

    /// @brief One body row. Fields a kind does not use are left at zero.
    struct BodyRecord
    {
        RecordKind kind;
        std::string name;
        f64 mass_kg;
        f64 radius_km;
        f64 temperature_k;
        f64 albedo;
        f64 greenhouse_k;
    };

    /// @brief Orbit declared by a row with a non-empty primary column.
    struct OrbitRecord
    {
        std::size_t body_index;   ///< Row in SystemDescription::bodies that orbits
        std::string primary;
        f64 semimajor_axis_km;
        f64 eccentricity;
    };

    /// @brief Parsed contents of a system CSV file.
    struct SystemDescription
    {
        std::string name;
        std::vector<BodyRecord> bodies;
        std::vector<OrbitRecord> orbits;
    };

    /// @brief Static utility class for reading system files.
    ///
    /// Expected CSV columns (header row required):
    ///   kind, name, mass_kg, radius_km, temperature_k, albedo, greenhouse_k,
    ///   primary, semimajor_axis_km, eccentricity
    ///
    /// Required columns per kind:
    /// - body:       mass_kg, radius_km
    /// - star:       mass_kg, radius_km, temperature_k
    /// - planet:     mass_kg, radius_km (albedo defaults to 0.3, greenhouse_k to 0)
    /// - black_hole: mass_kg
    ///
    /// A row whose primary column is non-empty also declares an orbit and
    /// must provide semimajor_axis_km and eccentricity.
    class SystemLoader
    {
    public:
        SystemLoader() = delete;

        static constexpr f64 kDefaultAlbedo = 0.3;

        /// @brief Parse a system CSV file.
        ///
        /// Malformed rows are logged and skipped. The description is named
        /// after the file stem.
        ///
        /// @param path Path to the CSV file.
        /// @return The description on success, std::nullopt if the file cannot
        ///         be read or contains no valid rows.
        [[nodiscard]] static std::optional<SystemDescription>
            load_csv(const std::filesystem::path& path);

        /// @brief Create every body, then every orbit in file order.
        ///
        /// Bodies and orbits the universe rejects are logged and skipped. An
        /// orbit is added only for a body the universe accepted, under the
        /// name the body received there.
        [[nodiscard]] static universe::Universe
            build_universe(const SystemDescription& description, bool allow_unstable = false);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        [[nodiscard]] static std::optional<RecordKind> parse_kind(std::string_view sv);

        /// @brief Split a CSV line on commas (no quoting).
        [[nodiscard]] static std::vector<std::string_view> split(std::string_view line);
    };

} // namespace orrery::catalog
