#include "DataStructures.h"
#include "MyConstants.h"
#include "Printers.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <set>
#include <string>
#include <vector>

using std::vector;
using std::set;

/***************** Reaction printers ****************/

static const char* arrowFor(const REACTION &rxn) {
  if(rxn.lb < 0.0f && rxn.ub > 0.0f) { return " <=> "; }
  if(rxn.ub <= 0.0f && rxn.lb < 0.0f) { return " <-- "; }
  return " --> ";
}

/* Reactants (sorted by coefficient) then the arrow then products. Exchanges still get an arrow */
string rxnFormula(const REACTION &rxn) {
  vector<STOICH> st = rxn.stoich;
  sort(st.begin(), st.end());
  string rxnString;
  bool arrowDone = false;
  for(int i=0; i < st.size(); i++) {
    double rxnCoeff = st[i].rxn_coeff;
    if(rxnCoeff < 0.0f) {
      rxnCoeff *= -1;
    }
    char coeffString[32];
    sprintf(coeffString, "%1.4f ", rxnCoeff);
    rxnString += coeffString;
    rxnString += st[i].met_name;

    if(i != st.size() - 1) {
      if(st[i+1].rxn_coeff * st[i].rxn_coeff < 0.0f) {
	rxnString += arrowFor(rxn);
        arrowDone = true;
      } else {
	rxnString += " + ";
      }
    }
  }
  if(!arrowDone) {
    /* All products: arrow goes in front */
    if(!st.empty() && st[0].rxn_coeff > 0.0f) { rxnString = string(arrowFor(rxn)).substr(1) + rxnString; }
    else { rxnString += arrowFor(rxn); }
  }
  return rxnString;
}

void printRxnsFromIntSet(const set<int> &intSet, const RXNSPACE &rxnspace) {
  if(intSet.empty()) { printf("EMPTY\n"); return; }
  for(set<int>::iterator it=intSet.begin(); it!=intSet.end(); it++) {
    printf("%s ", rxnspace.rxnPtrFromId(*it)->name.c_str());
  }
  printf("\n");
  return;
}

void printPartition(const PARTITION &partition, const RXNSPACE &rxnspace) {
  printf("BIOMASS (%d): ", (int)partition.biomass.size());
  printRxnsFromIntSet(partition.biomass, rxnspace);
  printf("CORE (%d): ", (int)partition.core.size());
  printRxnsFromIntSet(partition.core, rxnspace);
  printf("NONCORE (%d): ", (int)partition.noncore.size());
  printRxnsFromIntSet(partition.noncore, rxnspace);
  printf("CORE METABOLITES: %d\n", (int)partition.coreMets.size());
}

/***************** Lumped reaction printers ****************/

void printNetReaction(const NETREACTION &netReaction, const RXNSPACE &rxnspace) {
  printf("%s: %s\n", netReaction.rxn.name.c_str(), rxnFormula(netReaction.rxn).c_str());
  printf("  from: ");
  for(int j=0; j<netReaction.rxnIds.size(); j++) {
    printf("%s(%4.4f) ", rxnspace.rxnPtrFromId(netReaction.rxnIds[j])->name.c_str(), netReaction.rxnFluxes[j]);
  }
  printf("\n");
}

void printNetReactionVector(const vector<NETREACTION> &netReactions, const RXNSPACE &rxnspace) {
  for(int i=0; i<netReactions.size(); i++) {
    printNetReaction(netReactions[i], rxnspace);
  }
  return;
}

const char* solveStatusName(int status) {
  switch(status) {
  case SOLVE_SUCCESS: return "SUCCESS";
  case SOLVE_INFEASIBLE: return "INFEASIBLE";
  case SOLVE_UNBOUNDED: return "UNBOUNDED";
  case SOLVE_NUMERICAL: return "NUMERICAL FAILURE";
  case SOLVE_TIMEOUT: return "TIME LIMIT";
  case SOLVE_BAD_INPUT: return "BAD INPUT";
  }
  return "UNKNOWN";
}

/* One line per lump: name, formula, contributing reactions with their weights */
bool LUMPS_out(const char* fileName, const vector<NETREACTION> &lumps, const RXNSPACE &rxnspace) {
  FILE* output = fopen(fileName, "w");
  if(output == NULL) {
    printf("ERROR: Could not open %s for writing\n", fileName);
    return false;
  }
  fprintf(output, "name\tformula\treactions\n");
  for(int i=0; i<lumps.size(); i++) {
    fprintf(output, "%s\t%s\t", lumps[i].rxn.name.c_str(), rxnFormula(lumps[i].rxn).c_str());
    for(int j=0; j<lumps[i].rxnIds.size(); j++) {
      if(j > 0) { fprintf(output, ","); }
      fprintf(output, "%s(%1.6f)", rxnspace.rxnPtrFromId(lumps[i].rxnIds[j])->name.c_str(), lumps[i].rxnFluxes[j]);
    }
    fprintf(output, "\n");
  }
  fclose(output);
  return true;
}
