#pragma once
#include "graph.hpp"

// Loads the built-in five-point city map (A..E, seven roads).
void loadSeedGraph(Graph &g);

// Human-readable area name of a seed point, e.g. "Downtown" for "A".
std::string seedLabel(const std::string &id);
