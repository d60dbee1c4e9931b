#include <cstdio>
#include <map>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "DataStructures.h"
#include "MyConstants.h"
#include "pathUtils.h"
#include "YAML_loader.h"

/* cobrapy writes ordered maps as "!!omap" sequences of one-entry maps. Turn those into plain maps */
static YAML::Node flattenOmap(const YAML::Node &node) {
  if(!node.IsSequence()) { return node; }
  YAML::Node result(YAML::NodeType::Map);
  for(YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
    if(!it->IsMap()) { return node; }
    for(YAML::const_iterator entry = it->begin(); entry != it->end(); ++entry) {
      result[entry->first.as<string>()] = entry->second;
    }
  }
  return result;
}

static double boundOf(const YAML::Node &node, double fallback) {
  if(!node || node.IsNull()) { return fallback; }
  string text = node.as<string>();
  bool ok;
  double value = parseDouble(text, ok);
  if(!ok) { throw YAML::Exception(node.Mark(), "bad flux bound " + text); }
  return value;
}

static void parseMetabolite(const YAML::Node &raw, METSPACE &metspace) {
  YAML::Node node = flattenOmap(raw);
  METABOLITE tempm;
  tempm.id = metspace.mets.size();
  tempm.name = node["id"].as<string>();
  if(node["name"]) { tempm.longname = node["name"].as<string>(); }
  if(node["compartment"]) { tempm.compartment = node["compartment"].as<string>(); }
  if(node["formula"]) { tempm.chemform = node["formula"].as<string>(); }
  if(node["charge"] && !node["charge"].IsNull()) { tempm.charge = node["charge"].as<int>(); }
  YAML::Node annotation = flattenOmap(node["annotation"]);
  if(annotation && annotation.IsMap() && annotation["seed.compound"]) {
    YAML::Node seed = annotation["seed.compound"];
    tempm.seed_id = seed.IsSequence() ? seed[0].as<string>() : seed.as<string>();
  }
  metspace.addMetabolite(tempm);
}

static bool parseReaction(const YAML::Node &raw, const METSPACE &metspace, RXNSPACE &rxnspace) {
  YAML::Node node = flattenOmap(raw);
  REACTION tempr;
  tempr.id = rxnspace.rxns.size();
  tempr.name = node["id"].as<string>();
  if(node["name"]) { tempr.longname = node["name"].as<string>(); }
  if(node["subsystem"] && !node["subsystem"].IsNull()) { tempr.subsystem = node["subsystem"].as<string>(); }
  tempr.lb = boundOf(node["lower_bound"], -_db.DEFAULT_BOUND);
  tempr.ub = boundOf(node["upper_bound"], _db.DEFAULT_BOUND);
  if(tempr.lb > tempr.ub) {
    printf("ERROR: Reaction %s has lower bound %4.3f above upper bound %4.3f\n", tempr.name.c_str(), tempr.lb, tempr.ub);
    return false;
  }

  YAML::Node mets = flattenOmap(node["metabolites"]);
  for(YAML::const_iterator it = mets.begin(); it != mets.end(); ++it) {
    string metName = it->first.as<string>();
    int metId = metspace.idFromName(metName);
    if(metId == -1) {
      printf("ERROR: Reaction %s uses unknown metabolite %s\n", tempr.name.c_str(), metName.c_str());
      return false;
    }
    STOICH temps;
    temps.met_id = metId;
    temps.rxn_coeff = it->second.as<double>();
    temps.met_name = metName;
    if(temps.rxn_coeff != 0.0f) { tempr.stoich.push_back(temps); }
  }
  if(tempr.stoich.empty()) {
    printf("WARNING: Reaction %s has no metabolites and was skipped\n", tempr.name.c_str());
    return true;
  }
  rxnspace.addReaction(tempr);
  return true;
}

int parseCobraDict(const char* filename, MODEL &model) {
  model.clear();
  try {
    YAML::Node root = flattenOmap(YAML::LoadFile(filename));
    if(!root.IsMap() || !root["reactions"] || !root["metabolites"]) {
      printf("ERROR: %s is not a COBRA model (needs \"metabolites\" and \"reactions\")\n", filename);
      return LOAD_FAILED;
    }
    if(root["id"] && !root["id"].IsNull()) { model.name = root["id"].as<string>(); }

    const YAML::Node &mets = root["metabolites"];
    for(YAML::const_iterator it = mets.begin(); it != mets.end(); ++it) {
      parseMetabolite(*it, model.metabolites);
    }
    bool ok(true);
    const YAML::Node &rxns = root["reactions"];
    for(YAML::const_iterator it = rxns.begin(); it != rxns.end(); ++it) {
      if(!parseReaction(*it, model.metabolites, model.rxns)) { ok = false; }
    }
    if(!ok) {
      model.clear();
      return LOAD_FAILED;
    }
  } catch (const YAML::BadFile &e) {
    printf("ERROR: Could not open %s\n", filename);
    model.clear();
    return LOAD_FAILED;
  } catch (const YAML::Exception &e) {
    printf("ERROR: Could not read %s: %s\n", filename, e.what());
    model.clear();
    return LOAD_FAILED;
  }
  if(model.rxns.rxns.empty()) {
    printf("ERROR: Model %s has no reactions\n", filename);
    return LOAD_FAILED;
  }
  return LOAD_SUCCESS;
}
