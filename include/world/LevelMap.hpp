/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_MAP_HPP
#define LEVEL_MAP_HPP

#include "entities/EntityTypes.hpp"
#include "entities/WaypointPath.hpp"
#include "utils/Vector2D.hpp"
#include <boost/container/flat_set.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Bulwark {

struct MapDefinition {
    std::string name;
    int columns{20};
    int rows{15};
    float tileSize{40.0f};
    std::vector<GridCell> path;    // waypoint cells, walked in order
    std::vector<GridCell> blocked; // cells where nothing may be built
};

/**
 * @brief Placement grid plus the enemy path of one level
 *
 * Waypoints sit at cell centres. Every cell the path crosses (segments are
 * rasterised) is unbuildable.
 */
class LevelMap {
public:
    /**
     * @throws ConfigurationError on a path shorter than two cells, cells
     *         outside the grid, or a non-positive grid size
     */
    explicit LevelMap(const MapDefinition& definition);

    const std::string& getName() const { return m_name; }
    int getColumns() const { return m_columns; }
    int getRows() const { return m_rows; }
    float getTileSize() const { return m_tileSize; }
    float getWorldWidth() const { return static_cast<float>(m_columns) * m_tileSize; }
    float getWorldHeight() const { return static_cast<float>(m_rows) * m_tileSize; }

    const std::shared_ptr<const WaypointPath>& getPath() const { return m_path; }
    Vector2D getSpawnPoint() const { return m_path->point(0); }
    Vector2D getExitPoint() const { return m_path->point(m_path->lastIndex()); }

    Vector2D cellToWorld(GridCell cell) const;
    std::optional<GridCell> worldToCell(const Vector2D& position) const;

    bool isInBounds(GridCell cell) const;
    bool isOnPath(GridCell cell) const { return m_pathCells.contains(cell); }
    bool isBlocked(GridCell cell) const { return m_blockedCells.contains(cell); }
    bool isBuildable(GridCell cell) const { return isInBounds(cell) && !isOnPath(cell) && !isBlocked(cell); }

    size_t getPathCellCount() const { return m_pathCells.size(); }

private:
    void rasterizeSegment(GridCell from, GridCell to);

    std::string m_name;
    int m_columns;
    int m_rows;
    float m_tileSize;
    std::shared_ptr<const WaypointPath> m_path;
    boost::container::flat_set<GridCell> m_pathCells;
    boost::container::flat_set<GridCell> m_blockedCells;
};

} // namespace Bulwark

#endif // LEVEL_MAP_HPP
