/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelMap.hpp"
#include "core/ConfigurationError.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdlib>
#include <format>

namespace Bulwark {

LevelMap::LevelMap(const MapDefinition& definition)
    : m_name(definition.name)
    , m_columns(definition.columns)
    , m_rows(definition.rows)
    , m_tileSize(definition.tileSize)
{
    if (m_columns <= 0 || m_rows <= 0 || m_tileSize <= 0.0f) {
        throw ConfigurationError(std::format("Map '{}' has an invalid grid {}x{} (tile {})",
                                             m_name, m_columns, m_rows, m_tileSize));
    }
    if (definition.path.size() < 2) {
        throw ConfigurationError(std::format("Map '{}' path needs at least 2 waypoints, got {}",
                                             m_name, definition.path.size()));
    }

    std::vector<Vector2D> waypoints;
    waypoints.reserve(definition.path.size());
    for (const GridCell& cell : definition.path) {
        if (!isInBounds(cell)) {
            throw ConfigurationError(std::format("Map '{}' path cell ({}, {}) is outside the grid",
                                                 m_name, cell.col, cell.row));
        }
        waypoints.push_back(cellToWorld(cell));
    }
    m_path = std::make_shared<const WaypointPath>(std::move(waypoints));

    for (size_t i = 0; i + 1 < definition.path.size(); ++i) {
        rasterizeSegment(definition.path[i], definition.path[i + 1]);
    }

    for (const GridCell& cell : definition.blocked) {
        if (!isInBounds(cell)) {
            MAP_WARN(std::format("Map '{}' blocked cell ({}, {}) is outside the grid, ignored",
                                 m_name, cell.col, cell.row));
            continue;
        }
        m_blockedCells.insert(cell);
    }

    MAP_INFO(std::format("Loaded map '{}' {}x{}, path {} waypoints / {:.0f} units, {} path cells",
                         m_name, m_columns, m_rows, definition.path.size(),
                         m_path->totalLength(), m_pathCells.size()));
}

// Bresenham line between two waypoint cells, both ends included
void LevelMap::rasterizeSegment(GridCell from, GridCell to) {
    int x = from.col;
    int y = from.row;
    const int dx = std::abs(to.col - from.col);
    const int dy = -std::abs(to.row - from.row);
    const int sx = from.col < to.col ? 1 : -1;
    const int sy = from.row < to.row ? 1 : -1;
    int err = dx + dy;

    while (true) {
        m_pathCells.insert(GridCell{x, y});
        if (x == to.col && y == to.row) {
            break;
        }
        int e2 = 2 * err;
        if (e2 >= dy) {
            err += dy;
            x += sx;
        }
        if (e2 <= dx) {
            err += dx;
            y += sy;
        }
    }
}

Vector2D LevelMap::cellToWorld(GridCell cell) const {
    return Vector2D((static_cast<float>(cell.col) + 0.5f) * m_tileSize,
                    (static_cast<float>(cell.row) + 0.5f) * m_tileSize);
}

std::optional<GridCell> LevelMap::worldToCell(const Vector2D& position) const {
    GridCell cell{static_cast<int>(std::floor(position.getX() / m_tileSize)),
                  static_cast<int>(std::floor(position.getY() / m_tileSize))};
    if (!isInBounds(cell)) {
        return std::nullopt;
    }
    return cell;
}

bool LevelMap::isInBounds(GridCell cell) const {
    return cell.col >= 0 && cell.col < m_columns && cell.row >= 0 && cell.row < m_rows;
}

} // namespace Bulwark
