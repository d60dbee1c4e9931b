#include "DataStructures.h"
#include "InputSetup.h"
#include "Lumpgem.h"
#include "MyConstants.h"
#include "Printers.h"

#include <map>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using std::vector;
using std::map;
using std::string;

int main(int argc, char *argv[]) {
  printf("\n\n");

  LUMPPARAMS params;
  MODEL model;
  THERMODB thermoDb;

  printf("Setting up problem inputs...\n");fflush(stdout);
  if(InputSetup(argc, argv, params, model, thermoDb) != LOAD_SUCCESS) {
    printf("ERROR: Could not set up the problem - giving up\n");
    return 1;
  }
  printf("...done \n");fflush(stdout);

  if(params.autoGrowth) {
    printf("Computing the growth rate...\n");fflush(stdout);
    int status = resolveGrowthRate(model, thermoDb, params);
    if(status != SOLVE_SUCCESS) {
      printf("ERROR: Could not compute the growth rate (%s)\n", solveStatusName(status));
      return 1;
    }
    printf("...done \n");fflush(stdout);
  }

  /* Indicators, couplings and the objective are built here, once */
  LUMPGEM lumpgem(model, thermoDb, params);
  if(_db.DEBUGPARTITION) { printPartition(lumpgem.getPartition(), model.rxns); }

  vector<NETREACTION> lumps;
  vector<int> statuses;
  int numFailed = lumpgem.lumpAll(lumps, statuses);

  if(_db.PRINTLUMPS) { printNetReactionVector(lumps, model.rxns); }

  const set<int> &biomass = lumpgem.getPartition().biomass;
  int i(0);
  for(set<int>::const_iterator it = biomass.begin(); it != biomass.end(); ++it, ++i) {
    printf("%s\t%s\n", model.rxns.rxnPtrFromId(*it)->name.c_str(), solveStatusName(statuses[i]));
  }

  if(!LUMPS_out(params.outputFile.c_str(), lumps, model.rxns)) { return 1; }
  printf("%d lumped reactions written to %s (%d failed)\n", (int)lumps.size(), params.outputFile.c_str(), numFailed);

  return numFailed == 0 ? 0 : 2;
}
