/// @file system_loader.cpp
/// @brief Implementation of the CSV system loader.

#include "catalog/system_loader.hpp"

#include "core/logger.hpp"
#include "universe/celestial_body.hpp"

#include <charconv>
#include <fstream>
#include <memory>
#include <string>

namespace orrery::catalog
{

namespace
{

// Column layout: kind,name,mass_kg,radius_km,temperature_k,albedo,greenhouse_k,primary,semimajor_axis_km,eccentricity
enum Column : std::size_t
{
    kKind = 0,
    kName,
    kMass,
    kRadius,
    kTemperature,
    kAlbedo,
    kGreenhouse,
    kPrimary,
    kSemimajorAxis,
    kEccentricity,
    kColumnCount,
};

} // anonymous namespace

// -----------------------------------------------------------------
// Load system CSV
// -----------------------------------------------------------------

std::optional<SystemDescription> SystemLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ORR_CORE_ERROR("SystemLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    SystemDescription description;
    description.name = path.stem().string();

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        ORR_CORE_ERROR("SystemLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    u32 line_number = 1;
    u32 skipped = 0;

    // Empty cells fall back to a default; anything else must parse
    const auto optional_cell = [](std::string_view cell, f64 fallback) -> std::optional<f64> {
        return cell.empty() ? std::optional<f64>{fallback} : parse_f64(cell);
    };

    while (std::getline(file, line))
    {
        ++line_number;

        if (trim(line).empty() || trim(line).front() == '#')
        {
            continue;
        }

        const auto cells = split(line);
        if (cells.size() != kColumnCount)
        {
            ORR_CORE_WARN("SystemLoader: Malformed line {} (expected {} columns, got {}): {}",
                          line_number, static_cast<std::size_t>(kColumnCount), cells.size(), line);
            ++skipped;
            continue;
        }

        const auto kind = parse_kind(cells[kKind]);
        if (!kind)
        {
            ORR_CORE_WARN("SystemLoader: Unknown body kind '{}' on line {}", cells[kKind], line_number);
            ++skipped;
            continue;
        }

        const bool needs_radius = *kind != RecordKind::BlackHole;
        const bool needs_temperature = *kind == RecordKind::Star;

        const auto mass        = parse_f64(cells[kMass]);
        const auto radius      = needs_radius ? parse_f64(cells[kRadius]) : optional_cell(cells[kRadius], 0.0);
        const auto temperature = needs_temperature ? parse_f64(cells[kTemperature])
                                                   : optional_cell(cells[kTemperature], 0.0);
        const auto albedo      = optional_cell(cells[kAlbedo], kDefaultAlbedo);
        const auto greenhouse  = optional_cell(cells[kGreenhouse], 0.0);

        if (!mass || !radius || !temperature || !albedo || !greenhouse)
        {
            ORR_CORE_WARN("SystemLoader: Failed to parse values on line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const std::string_view primary = cells[kPrimary];
        std::optional<OrbitRecord> orbit;
        if (!primary.empty())
        {
            const auto semimajor_axis = parse_f64(cells[kSemimajorAxis]);
            const auto eccentricity = parse_f64(cells[kEccentricity]);
            if (!semimajor_axis || !eccentricity)
            {
                ORR_CORE_WARN("SystemLoader: Failed to parse orbit on line {}: {}", line_number, line);
                ++skipped;
                continue;
            }

            orbit = OrbitRecord{
                .body_index        = description.bodies.size(),
                .primary           = std::string{primary},
                .semimajor_axis_km = *semimajor_axis,
                .eccentricity      = *eccentricity,
            };
        }

        description.bodies.push_back(BodyRecord{
            .kind          = *kind,
            .name          = std::string{cells[kName]},
            .mass_kg       = *mass,
            .radius_km     = *radius,
            .temperature_k = *temperature,
            .albedo        = *albedo,
            .greenhouse_k  = *greenhouse,
        });

        if (orbit)
        {
            description.orbits.push_back(std::move(*orbit));
        }
    }

    if (description.bodies.empty())
    {
        ORR_CORE_ERROR("SystemLoader: No valid bodies found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        ORR_CORE_WARN("SystemLoader: Skipped {} malformed lines", skipped);
    }

    ORR_CORE_INFO("SystemLoader: Loaded {} bodies and {} orbits from {}",
                  description.bodies.size(), description.orbits.size(), path.string());

    return description;
}

// -----------------------------------------------------------------
// Build a universe: bodies first, then orbits in file order
// -----------------------------------------------------------------

universe::Universe SystemLoader::build_universe(const SystemDescription& description, bool allow_unstable)
{
    using namespace universe;

    Universe result{description.name};

    // Name each accepted row received in the universe, empty if rejected
    std::vector<std::string> registered_names(description.bodies.size());

    u32 rejected_bodies = 0;
    for (std::size_t i = 0; i < description.bodies.size(); ++i)
    {
        const BodyRecord& record = description.bodies[i];
        std::unique_ptr<CelestialBody> body;
        switch (record.kind)
        {
            case RecordKind::Body:
                body = CelestialBody::create(record.name, record.mass_kg, record.radius_km);
                break;
            case RecordKind::Star:
                body = SolarBody::create(record.name, record.mass_kg, record.radius_km, record.temperature_k);
                break;
            case RecordKind::Planet:
                body = PlanetaryBody::create(record.name, record.mass_kg, record.radius_km,
                                             record.albedo, record.greenhouse_k);
                break;
            case RecordKind::BlackHole:
                body = BlackHole::create(record.name, record.mass_kg);
                break;
        }

        const CelestialBody* added = body.get();
        if (result.add_body(std::move(body)) != AddBodyStatus::Added)
        {
            ++rejected_bodies;
            continue;
        }
        registered_names[i] = added->name();
    }

    u32 rejected_orbits = 0;
    for (const auto& record : description.orbits)
    {
        if (record.body_index >= registered_names.size() || registered_names[record.body_index].empty())
        {
            ORR_CORE_WARN("SystemLoader: '{}': skipping orbit around '{}' of a rejected body",
                          description.name, record.primary);
            ++rejected_orbits;
            continue;
        }

        const OrbitStatus status = result.add_orbit(
            record.primary, registered_names[record.body_index],
            record.semimajor_axis_km, record.eccentricity, allow_unstable);
        if (status != OrbitStatus::Valid)
        {
            ++rejected_orbits;
        }
    }

    if (rejected_bodies > 0 || rejected_orbits > 0)
    {
        ORR_CORE_WARN("SystemLoader: '{}' built with {} rejected bodies and {} rejected orbits",
                      description.name, rejected_bodies, rejected_orbits);
    }

    return result;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view SystemLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> SystemLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects a leading '+'
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<RecordKind> SystemLoader::parse_kind(std::string_view sv)
{
    if (sv == "body")       return RecordKind::Body;
    if (sv == "star")       return RecordKind::Star;
    if (sv == "planet")     return RecordKind::Planet;
    if (sv == "black_hole") return RecordKind::BlackHole;
    return std::nullopt;
}

std::vector<std::string_view> SystemLoader::split(std::string_view line)
{
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            cells.push_back(trim(line.substr(start)));
            break;
        }
        cells.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return cells;
}

} // namespace orrery::catalog
