#ifndef PARTITION_H
#define PARTITION_H

#include "DataStructures.h"

#include <set>
#include <string>

/* Put every reaction of rxnspace into exactly one of partition.biomass, partition.core, partition.noncore.
   A name listed in biomassNames wins over a subsystem listed in coreSubsystems.
   Metabolites of core reactions are collected in partition.coreMets. */
void partitionNetwork(const RXNSPACE &rxnspace, const set<string> &biomassNames, const set<string> &coreSubsystems,
		      PARTITION &partition);

/* Names in wanted that do not match any reaction name (for warnings) */
vector<string> missingReactions(const RXNSPACE &rxnspace, const vector<string> &wanted);

#endif
