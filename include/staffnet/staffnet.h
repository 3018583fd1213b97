// staffnet.h - Umbrella header for the staff network library
// Part of the staff network library (C++20)
//
// Pipeline:
//   staff rows -> relationship table -> co-staff graph
//              -> promotion mapper + connection scorer -> staff assembler
//              -> staff aggregator -> candidate clustering

#ifndef STAFFNET_STAFFNET_H
#define STAFFNET_STAFFNET_H

// Core
#include "core/coach_types.h"
#include "core/defaults.h"
#include "core/run_stats.h"

// Tables
#include "table/closeness_table.h"
#include "table/performance_source.h"
#include "table/relationship_table.h"

// Graph
#include "graph/graph_concepts.h"
#include "graph/runtime_graph.h"
#include "graph/hop_distance.h"
#include "graph/costaff_graph.h"
#include "graph/connected_components.h"
#include "graph/graph_stats.h"
#include "graph/weighted_assignment.h"

// Staff assembly
#include "staff/connection_score.h"
#include "staff/promotion.h"
#include "staff/staff_assembler.h"

// Ranking
#include "ranking/staff_summary.h"
#include "ranking/candidate_clustering.h"
#include "ranking/composite_value.h"
#include "ranking/staff_aggregator.h"

// I/O
#include "io/csv_detail.h"
#include "io/table_io.h"

#endif // STAFFNET_STAFFNET_H
