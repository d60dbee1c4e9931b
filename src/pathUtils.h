#ifndef _PATHUTILS
#define _PATHUTILS

#include "DataStructures.h"

/* String utilities */
bool hasSuffix(const string &name, const string &suffix);
string stripCompartment(const string &metName);
string stripIdPrefix(const string &id, const char* prefix);
string trimWhitespace(const string &in);
double parseDouble(const string &in, bool &ok);

/* Add coefficient * (stoichiometry of rxn) to the running sum in lumped (metabolite ID -> coefficient) */
void addScaledStoich(map<int, double> &lumped, const REACTION &rxn, double coefficient);
/* Convert a metabolite ID -> coefficient map back into STOICHs (dropping zeros), sorted by metabolite ID */
vector<STOICH> stoichFromMap(const map<int, double> &lumped, const METSPACE &metspace, double cutoff);

int rougheq(const double one, const double two, const double constant);

#endif
