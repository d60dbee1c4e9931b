/* Test network and temporary file helpers shared by the tests */

#include "TestNetwork.h"

#include <gtest/gtest.h>
#include <cstdio>
#include <string>
#include <vector>

MODEL makeTestNetwork() {
  vector<METABOLITE> metList;
  vector<REACTION> rxnList;
  vector<STOICH> stoichList;

  /* Construct metabolites */
  metList.push_back(makeMetabolite(0, "S", true));
  metList.push_back(makeMetabolite(1, "M1", false));
  metList.push_back(makeMetabolite(2, "M2", false));
  metList.push_back(makeMetabolite(3, "M3", false));

  /* R1: M1 --> M2 */
  stoichList.clear();
  stoichList.push_back(makeStoich("M1", -1, 1));
  stoichList.push_back(makeStoich("M2", 1, 2));
  rxnList.push_back(makeReaction(0, "R1", "Core", -1000.0f, 1000.0f, stoichList));

  /* R2: M1 --> M3 */
  stoichList.clear();
  stoichList.push_back(makeStoich("M1", -1, 1));
  stoichList.push_back(makeStoich("M3", 1, 3));
  rxnList.push_back(makeReaction(1, "R2", "Core", -1000.0f, 1000.0f, stoichList));

  /* R3: S --> M1 (carbon source) */
  stoichList.clear();
  stoichList.push_back(makeStoich("S", -1, 0));
  stoichList.push_back(makeStoich("M1", 1, 1));
  rxnList.push_back(makeReaction(2, "R3", "Transport", -1000.0f, 1000.0f, stoichList));

  /* B: M2 + M3 --> */
  stoichList.clear();
  stoichList.push_back(makeStoich("M2", -1, 2));
  stoichList.push_back(makeStoich("M3", -1, 3));
  rxnList.push_back(makeReaction(3, "B", "Core", 0.0f, 0.1f, stoichList));

  MODEL result;
  result.name = "toy";
  result.metabolites = METSPACE(metList);
  result.rxns = RXNSPACE(rxnList);
  return result;
}

THERMODB makeTestThermoDB() {
  THERMODB db;
  db.name = "toy";
  db.units = "kJ/mol";
  const char* ids[4] = {"S", "M1", "M2", "M3"};
  double dg[4] = {0.0f, -10.0f, -20.0f, -20.0f};
  for(int i=0; i<4; i++) {
    THERMOCOMPOUND cpd;
    cpd.id = ids[i];
    cpd.deltaGf_std = dg[i];
    cpd.deltaGf_err = 0.0f;
    db.compounds[cpd.id] = cpd;
  }
  return db;
}

LUMPPARAMS makeTestParams() {
  LUMPPARAMS params;
  params.biomassRxns.push_back("B");
  params.coreSubsystems.push_back("Core");
  params.carbonUptake = 10.0f;
  params.growthRate = 0.1f;
  params.timeout = 60.0f;
  return params;
}

METABOLITE makeMetabolite(int id, const char* name, bool boundary) {
  METABOLITE met;
  met.id = id;
  met.name = name;
  met.boundary = boundary;
  return met;
}

STOICH makeStoich(const char* name, double coeff, int met_id) {
  STOICH st;
  st.met_name = name;
  st.rxn_coeff = coeff;
  st.met_id = met_id;
  return st;
}

REACTION makeReaction(int id, const char* name, const char* subsystem, double lb, double ub, const vector<STOICH> &stoich) {
  REACTION rxn;
  rxn.id = id;
  rxn.name = name;
  rxn.subsystem = subsystem;
  rxn.lb = lb;
  rxn.ub = ub;
  rxn.stoich = stoich;
  return rxn;
}

string writeTempFile(const string &fileName, const string &contents) {
  string path = testing::TempDir() + fileName;
  FILE* fid = fopen(path.c_str(), "w");
  if(fid == NULL) { ADD_FAILURE() << "Could not write " << path; return path; }
  fputs(contents.c_str(), fid);
  fclose(fid);
  return path;
}
