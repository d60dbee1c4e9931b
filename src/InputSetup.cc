#include "DataStructures.h"
#include "InputSetup.h"
#include "MyConstants.h"
#include "pathUtils.h"
#include "XML_loader.h"
#include "YAML_loader.h"

#include <cstdio>
#include <map>
#include <string>

int loadModel(const char* filename, MODEL &model) {
  string name(filename);
  if(hasSuffix(name, ".xml") || hasSuffix(name, ".sbml")) {
    return parseSBML(filename, model);
  }
  if(hasSuffix(name, ".yml") || hasSuffix(name, ".yaml") || hasSuffix(name, ".json")) {
    return parseCobraDict(filename, model);
  }
  if(hasSuffix(name, ".mat")) {
    printf("ERROR: MATLAB models (%s) are not supported - convert the model to SBML, YAML or JSON\n", filename);
    return LOAD_UNSUPPORTED;
  }
  printf("ERROR: Unknown model format %s (expected .xml, .yml or .json)\n", filename);
  return LOAD_UNSUPPORTED;
}

int applyMedium(MODEL &model, const map<string, double> &medium) {
  int status = LOAD_SUCCESS;
  for(map<string, double>::const_iterator it = medium.begin(); it != medium.end(); ++it) {
    int rxnId = model.rxns.idFromName(it->first);
    if(rxnId == -1) {
      printf("ERROR: Medium reaction %s is not in the model\n", it->first.c_str());
      status = LOAD_FAILED;
      continue;
    }
    model.rxns.change_Lb(rxnId, it->second);
  }
  return status;
}

int InputSetup(int argc, char *argv[], LUMPPARAMS &params, MODEL &model, THERMODB &thermoDb) {
  if(argc!=2){
    printf("Usage: %s params.xml\n", argv[0]);
    return LOAD_FAILED;
  }

  int status = parseParams(argv[1], params);
  if(status != LOAD_SUCCESS) { return status; }

  printf("Loading model %s...\n", params.modelFile.c_str());
  status = loadModel(params.modelFile.c_str(), model);
  if(status != LOAD_SUCCESS) { return status; }
  printf("...%d reactions and %d metabolites\n", (int)model.rxns.rxns.size(), (int)model.metabolites.mets.size());

  status = applyMedium(model, params.medium);
  if(status != LOAD_SUCCESS) { return status; }

  printf("Loading thermodynamic database %s...\n", params.thermoFile.c_str());
  status = parseThermoDB(params.thermoFile.c_str(), thermoDb);
  if(status != LOAD_SUCCESS) { return status; }
  printf("...%d compounds\n", (int)thermoDb.compounds.size());
  return LOAD_SUCCESS;
}
