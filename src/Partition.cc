#include "DataStructures.h"
#include "MyConstants.h"
#include "Partition.h"

#include <cstdio>
#include <set>
#include <string>
#include <vector>

void partitionNetwork(const RXNSPACE &rxnspace, const set<string> &biomassNames, const set<string> &coreSubsystems,
		      PARTITION &partition) {
  partition.clear();
  for(int i=0; i<rxnspace.rxns.size(); i++) {
    const REACTION &rxn = rxnspace.rxns[i];
    if(biomassNames.count(rxn.name) > 0) {
      partition.biomass.insert(rxn.id);
      if(_db.DEBUGPARTITION) { printf("BIOMASS\t%s\n", rxn.name.c_str()); }
    } else if(coreSubsystems.count(rxn.subsystem) > 0) {
      partition.core.insert(rxn.id);
      for(int j=0; j<rxn.stoich.size(); j++) {
	partition.coreMets.insert(rxn.stoich[j].met_id);
      }
      if(_db.DEBUGPARTITION) { printf("CORE\t%s\t%s\n", rxn.name.c_str(), rxn.subsystem.c_str()); }
    } else {
      partition.noncore.insert(rxn.id);
      if(_db.DEBUGPARTITION) { printf("NONCORE\t%s\t%s\n", rxn.name.c_str(), rxn.subsystem.c_str()); }
    }
  }
}

vector<string> missingReactions(const RXNSPACE &rxnspace, const vector<string> &wanted) {
  vector<string> missing;
  for(int i=0; i<wanted.size(); i++) {
    if(!rxnspace.nameIn(wanted[i])) { missing.push_back(wanted[i]); }
  }
  return missing;
}
