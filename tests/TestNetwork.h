#ifndef TESTNETWORK_H
#define TESTNETWORK_H

#include "DataStructures.h"

#include <string>

/* Small test network:

              R1
   S --R3--> M1 ----> M2 --\
              \              B -->
               \--R2--> M3 -/

   S is a boundary metabolite. R1, R2 are in subsystem "Core"; R3 is in "Transport";
   B (bounds [0, 0.1]) is also labelled "Core" so that the biomass name has to win. */
MODEL makeTestNetwork();
/* Formation energies (kJ/mol): S 0, M1 -10, M2 -20, M3 -20, no errors */
THERMODB makeTestThermoDB();
/* Parameters for lumping B out of the test network with C = 10 and growth 0.1 */
LUMPPARAMS makeTestParams();

METABOLITE makeMetabolite(int id, const char* name, bool boundary);
STOICH makeStoich(const char* name, double coeff, int met_id);
REACTION makeReaction(int id, const char* name, const char* subsystem, double lb, double ub, const vector<STOICH> &stoich);

/* Write contents to a file in the test temporary directory and return its path */
string writeTempFile(const string &fileName, const string &contents);

#endif
