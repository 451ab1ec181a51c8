#pragma once

#include <cmath>
#include <string>
#include "data.hpp"

enum LocalTopology
{
    RECT=8, HEXA=6, CIRC=4
};

inline std::string get_local_topology_string(LocalTopology local_topology)
{
    switch (local_topology)
    {
    case LocalTopology::RECT:
        return "rectangular (8 neighbours)";
        break;
    case LocalTopology::HEXA:
        return "hexagonal (6 neighbours)";
    case LocalTopology::CIRC:
        return "circular (euclidean)";
    default:
        return "UNKNOWN";
        break;
    }
}

enum GlobalTopology
{
    TORUS=0, PLANE=4
};

inline std::string get_global_topology_string(GlobalTopology global_topology)
{
    switch (global_topology)
    {
    case GlobalTopology::TORUS:
        return "torus (connecting east/west and north/south)";
        break;
    case GlobalTopology::PLANE:
        return "plane";
        break;
    default:
        return "UNKNOWN";
        break;
    }
}

LocalTopology parse_local_topology(const std::string& name);
GlobalTopology parse_global_topology(const std::string& name);

// Arguments are (row1, col1, row2, col2, height, width)
typedef Float (*DistanceFunction) (int, int, int, int, int, int);

DistanceFunction distance_function(GlobalTopology global_topology, LocalTopology local_topology);
