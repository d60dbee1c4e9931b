#ifndef PRINTERS_H
#define PRINTERS_H

/* printers.h - various utilities for printing results */

#include <vector>
#include <set>
#include "DataStructures.h"

using std::vector;
using std::set;

/* Reaction printers */
string rxnFormula(const REACTION &rxn);
void printRxnsFromIntSet(const set<int> &intSet, const RXNSPACE &rxnspace);
void printPartition(const PARTITION &partition, const RXNSPACE &rxnspace);

/* Lumped reaction printers */
void printNetReaction(const NETREACTION &netReaction, const RXNSPACE &rxnspace);
void printNetReactionVector(const vector<NETREACTION> &netReactions, const RXNSPACE &rxnspace);
const char* solveStatusName(int status);

/* Generate output files. Returns false if the file could not be written */
bool LUMPS_out(const char* fileName, const vector<NETREACTION> &lumps, const RXNSPACE &rxnspace);

#endif
