#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <libxml/parser.h>
#include <libxml/xmlmemory.h>

#include "DataStructures.h"
#include "MyConstants.h"
#include "pathUtils.h"
#include "XML_loader.h"

#include <vector>
#include <cmath>
#include <algorithm>
#include <map>
#include <string>

using std::vector;
using std::map;
using std::string;

static string nodeText(xmlDocPtr doc, xmlNodePtr cur);
static string nodeProp(xmlNodePtr cur, const char* prop);
static xmlDocPtr openDoc(const char* docname, const char* rootName);
static void collectNotes(xmlNodePtr cur, vector<string> &lines);
static void parseSPECIES(xmlNodePtr cur, METSPACE &metspace);
static void parseSPECIESREF(xmlNodePtr cur, const METSPACE &metspace, double sign, map<int, double> &coeffs, bool &ok);
static void parseKINETICLAW(xmlNodePtr cur, REACTION &tempr);
static bool parseREACTION(xmlDocPtr doc, xmlNodePtr cur, const METSPACE &metspace, const map<string, double> &parameters,
			  RXNSPACE &rxnspace);
static bool parseCOMPOUND(xmlDocPtr doc, xmlNodePtr cur, double scale, THERMODB &thermoDb);
static bool parseMEDIUM(xmlDocPtr doc, xmlNodePtr cur, map<string, double> &medium);

/* Whitespace-trimmed text content of a node */
static string nodeText(xmlDocPtr doc, xmlNodePtr cur) {
  xmlChar *key = xmlNodeListGetString(doc, cur->xmlChildrenNode, 1);
  if(key == NULL) { return string(); }
  string result = trimWhitespace((char*)key);
  xmlFree(key);
  return result;
}

/* Empty if the attribute is not there. Namespace prefixes are ignored (fbc:charge matches "charge") */
static string nodeProp(xmlNodePtr cur, const char* prop) {
  xmlChar *key = xmlGetProp(cur, (const xmlChar *)prop);
  if(key == NULL) { return string(); }
  string result = (char*)key;
  xmlFree(key);
  return result;
}

static xmlDocPtr openDoc(const char* docname, const char* rootName) {
  xmlDocPtr doc = xmlParseFile(docname);
  if (doc == NULL ) {
    printf("ERROR: Document %s not parsed successfully\n", docname);
    return NULL;
  }
  xmlNodePtr cur = xmlDocGetRootElement(doc);
  if (cur == NULL) {
    printf("ERROR: Document %s is empty\n", docname);
    xmlFreeDoc(doc);
    return NULL;
  }
  if (xmlStrcmp(cur->name, (const xmlChar *) rootName)) {
    printf("ERROR: Document %s of the wrong type, root node != %s\n", docname, rootName);
    xmlFreeDoc(doc);
    return NULL;
  }
  return doc;
}

/******************** SBML ********************/

/* Text of every <p> under the notes */
static void collectNotes(xmlNodePtr cur, vector<string> &lines) {
  for(xmlNodePtr child = cur->xmlChildrenNode; child != NULL; child = child->next) {
    if(child->type != XML_ELEMENT_NODE) { continue; }
    if(!xmlStrcmp(child->name, (const xmlChar *)"p")) {
      xmlChar *key = xmlNodeGetContent(child);
      if(key != NULL) {
	lines.push_back(trimWhitespace((char*)key));
	xmlFree(key);
      }
    } else {
      collectNotes(child, lines);
    }
  }
}

static void parseSPECIES(xmlNodePtr cur, METSPACE &metspace) {
  METABOLITE tempm;
  tempm.id = metspace.mets.size();
  tempm.name = stripIdPrefix(nodeProp(cur, "id"), "M_");
  tempm.longname = nodeProp(cur, "name");
  tempm.compartment = nodeProp(cur, "compartment");
  tempm.chemform = nodeProp(cur, "chemicalFormula");
  string charge = nodeProp(cur, "charge");
  if(!charge.empty()) { tempm.charge = atoi(charge.c_str()); }
  tempm.boundary = (nodeProp(cur, "boundaryCondition") == "true");
  if(tempm.name.empty()) {
    printf("WARNING: Skipped a species with no id - this is very likely an SBML error!\n");
    return;
  }
  metspace.addMetabolite(tempm);
}

static void parseSPECIESREF(xmlNodePtr cur, const METSPACE &metspace, double sign, map<int, double> &coeffs, bool &ok) {
  for(xmlNodePtr ref = cur->xmlChildrenNode; ref != NULL; ref = ref->next) {
    if(xmlStrcmp(ref->name, (const xmlChar *)"speciesReference")) { continue; }
    string species = stripIdPrefix(nodeProp(ref, "species"), "M_");
    int metId = metspace.idFromName(species);
    if(metId == -1) {
      printf("ERROR: Species reference to unknown species %s\n", species.c_str());
      ok = false;
      continue;
    }
    double coeff(1.0f);
    string stoich = nodeProp(ref, "stoichiometry");
    if(!stoich.empty()) {
      bool good;
      coeff = parseDouble(stoich, good);
      if(!good) {
	printf("ERROR: Bad stoichiometry %s for species %s\n", stoich.c_str(), species.c_str());
	ok = false;
	continue;
      }
    }
    coeffs[metId] += sign * coeff;
  }
}

/* COBRA toolbox style bounds: <kineticLaw><listOfParameters><parameter id="LOWER_BOUND" value=".."/> */
static void parseKINETICLAW(xmlNodePtr cur, REACTION &tempr) {
  for(xmlNodePtr list = cur->xmlChildrenNode; list != NULL; list = list->next) {
    if(xmlStrcmp(list->name, (const xmlChar *)"listOfParameters") && xmlStrcmp(list->name, (const xmlChar *)"listOfLocalParameters")) { continue; }
    for(xmlNodePtr par = list->xmlChildrenNode; par != NULL; par = par->next) {
      if(par->type != XML_ELEMENT_NODE) { continue; }
      string id = nodeProp(par, "id");
      bool good;
      double value = parseDouble(nodeProp(par, "value"), good);
      if(!good) { continue; }
      if(id == "LOWER_BOUND") { tempr.lb = value; }
      if(id == "UPPER_BOUND") { tempr.ub = value; }
    }
  }
}

static bool parseREACTION(xmlDocPtr doc, xmlNodePtr cur, const METSPACE &metspace, const map<string, double> &parameters,
			  RXNSPACE &rxnspace) {
  REACTION tempr;
  bool ok(true);
  tempr.id = rxnspace.rxns.size();
  tempr.name = stripIdPrefix(nodeProp(cur, "id"), "R_");
  tempr.longname = nodeProp(cur, "name");
  if(nodeProp(cur, "reversible") == "false") { tempr.lb = 0.0f; }

  map<int, double> coeffs;
  for(xmlNodePtr child = cur->xmlChildrenNode; child != NULL; child = child->next) {
    if(!xmlStrcmp(child->name, (const xmlChar *)"listOfReactants")) {
      parseSPECIESREF(child, metspace, -1.0f, coeffs, ok);
    }
    if(!xmlStrcmp(child->name, (const xmlChar *)"listOfProducts")) {
      parseSPECIESREF(child, metspace, 1.0f, coeffs, ok);
    }
    if(!xmlStrcmp(child->name, (const xmlChar *)"kineticLaw")) {
      parseKINETICLAW(child, tempr);
    }
    if(!xmlStrcmp(child->name, (const xmlChar *)"notes")) {
      vector<string> lines;
      collectNotes(child, lines);
      for(int i=0; i<lines.size(); i++) {
	if(lines[i].compare(0, 10, "SUBSYSTEM:") == 0) { tempr.subsystem = trimWhitespace(lines[i].substr(10)); }
      }
    }
  }

  /* fbc bounds refer to global parameters and win over anything in the kinetic law */
  const char* fbcBounds[2] = {"lowerFluxBound", "upperFluxBound"};
  for(int i=0; i<2; i++) {
    string ref = nodeProp(cur, fbcBounds[i]);
    if(ref.empty()) { continue; }
    map<string, double>::const_iterator it = parameters.find(ref);
    if(it == parameters.end()) {
      printf("ERROR: Reaction %s uses undefined bound parameter %s\n", tempr.name.c_str(), ref.c_str());
      ok = false;
      continue;
    }
    if(i == 0) { tempr.lb = it->second; }
    else { tempr.ub = it->second; }
  }
  string subsystem = nodeProp(cur, "subsystem");
  if(tempr.subsystem.empty() && !subsystem.empty()) { tempr.subsystem = subsystem; }

  for(map<int, double>::iterator it = coeffs.begin(); it != coeffs.end(); ++it) {
    if(it->second == 0.0f) { continue; }
    STOICH temps;
    temps.met_id = it->first;
    temps.rxn_coeff = it->second;
    temps.met_name = metspace.metPtrFromId(it->first)->name;
    tempr.stoich.push_back(temps);
  }

  if(tempr.name.empty()) {
    printf("ERROR: Reaction with no id\n");
    return false;
  }
  if(tempr.lb > tempr.ub) {
    printf("ERROR: Reaction %s has lower bound %4.3f above upper bound %4.3f\n", tempr.name.c_str(), tempr.lb, tempr.ub);
    return false;
  }
  /* Only bother including this reaction if there is anything present in S. Otherwise it's a dud... */
  if(tempr.stoich.empty()) {
    printf("WARNING: Reaction %s has no metabolites and was skipped\n", tempr.name.c_str());
    return ok;
  }
  rxnspace.addReaction(tempr);
  return ok;
}

int parseSBML(const char* docname, MODEL &model) {
  model.clear();
  xmlDocPtr doc = openDoc(docname, "sbml");
  if(doc == NULL) { return LOAD_FAILED; }

  xmlNodePtr cur = xmlDocGetRootElement(doc)->xmlChildrenNode;
  while(cur != NULL && xmlStrcmp(cur->name, (const xmlChar *)"model")) { cur = cur->next; }
  if(cur == NULL) {
    printf("ERROR: No <model> in %s\n", docname);
    xmlFreeDoc(doc);
    return LOAD_FAILED;
  }
  model.name = nodeProp(cur, "id");

  /* Species and parameters have to be known before any reaction is read */
  map<string, double> parameters;
  xmlNodePtr modelNode = cur;
  for(cur = modelNode->xmlChildrenNode; cur != NULL; cur = cur->next) {
    if(!xmlStrcmp(cur->name, (const xmlChar *)"listOfSpecies")) {
      for(xmlNodePtr sp = cur->xmlChildrenNode; sp != NULL; sp = sp->next) {
	if(!xmlStrcmp(sp->name, (const xmlChar *)"species")) { parseSPECIES(sp, model.metabolites); }
      }
    }
    if(!xmlStrcmp(cur->name, (const xmlChar *)"listOfParameters")) {
      for(xmlNodePtr par = cur->xmlChildrenNode; par != NULL; par = par->next) {
	if(xmlStrcmp(par->name, (const xmlChar *)"parameter")) { continue; }
	bool good;
	double value = parseDouble(nodeProp(par, "value"), good);
	if(good) { parameters[nodeProp(par, "id")] = value; }
      }
    }
  }

  bool ok(true);
  for(cur = modelNode->xmlChildrenNode; cur != NULL; cur = cur->next) {
    if(xmlStrcmp(cur->name, (const xmlChar *)"listOfReactions")) { continue; }
    for(xmlNodePtr rx = cur->xmlChildrenNode; rx != NULL; rx = rx->next) {
      if(xmlStrcmp(rx->name, (const xmlChar *)"reaction")) { continue; }
      if(!parseREACTION(doc, rx, model.metabolites, parameters, model.rxns)) { ok = false; }
    }
  }
  xmlFreeDoc(doc);

  if(!ok) {
    printf("ERROR: Failed to load SBML model %s\n", docname);
    model.clear();
    return LOAD_FAILED;
  }
  if(model.rxns.rxns.empty()) {
    printf("ERROR: SBML model %s has no reactions\n", docname);
    return LOAD_FAILED;
  }
  return LOAD_SUCCESS;
}

/******************** Thermodynamic database ********************/

static bool parseCOMPOUND(xmlDocPtr doc, xmlNodePtr cur, double scale, THERMODB &thermoDb) {
  THERMOCOMPOUND tempc;
  bool haveDg(false);
  cur = cur->xmlChildrenNode;
  while (cur != NULL) {
    bool good(true);
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"id"))) {
      tempc.id = nodeText(doc, cur);
    }
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"formula"))) {
      tempc.formula = nodeText(doc, cur);
    }
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"charge_std"))) {
      tempc.charge_std = atoi(nodeText(doc, cur).c_str());
    }
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"deltaGf_std"))) {
      tempc.deltaGf_std = scale * parseDouble(nodeText(doc, cur), good);
      haveDg = good;
    }
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"deltaGf_err"))) {
      tempc.deltaGf_err = scale * parseDouble(nodeText(doc, cur), good);
    }
    if(!good) {
      printf("ERROR: Bad number in compound %s\n", tempc.id.c_str());
      return false;
    }
    cur = cur->next;
  }

  if(tempc.id.empty()) {
    printf("WARNING: Skipped over a compound with no id - this is very likely an XML error!\n");
    return true;
  }
  /* A compound without a formation energy is the same as no compound */
  if(!haveDg) { return true; }
  thermoDb.compounds[tempc.id] = tempc;
  return true;
}

int parseThermoDB(const char* docname, THERMODB &thermoDb) {
  thermoDb.clear();
  xmlDocPtr doc = openDoc(docname, "thermodb");
  if(doc == NULL) { return LOAD_FAILED; }
  xmlNodePtr cur = xmlDocGetRootElement(doc);
  thermoDb.name = nodeProp(cur, "name");
  thermoDb.units = nodeProp(cur, "units");

  double scale(1.0f);
  if(thermoDb.units == "kcal/mol") { scale = _db.KCAL_TO_KJ; }
  else if(!thermoDb.units.empty() && thermoDb.units != "kJ/mol") {
    printf("ERROR: Unknown energy units %s in %s\n", thermoDb.units.c_str(), docname);
    xmlFreeDoc(doc);
    return LOAD_FAILED;
  }

  bool ok(true);
  for(cur = cur->xmlChildrenNode; cur != NULL; cur = cur->next) {
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"compound"))){
      if(!parseCOMPOUND(doc, cur, scale, thermoDb)) { ok = false; }
    }
  }
  xmlFreeDoc(doc);
  if(!ok) {
    thermoDb.clear();
    return LOAD_FAILED;
  }
  thermoDb.units = "kJ/mol";
  return LOAD_SUCCESS;
}

/******************** Run parameters ********************/

/* <medium><rxn id="EX_glc__D_e">-10</rxn>...</medium> */
static bool parseMEDIUM(xmlDocPtr doc, xmlNodePtr cur, map<string, double> &medium) {
  for(cur = cur->xmlChildrenNode; cur != NULL; cur = cur->next) {
    if(xmlStrcmp(cur->name, (const xmlChar *)"rxn")) { continue; }
    string id = nodeProp(cur, "id");
    bool good;
    double lb = parseDouble(nodeText(doc, cur), good);
    if(id.empty() || !good) {
      printf("ERROR: Medium entries need an id and a numeric lower bound\n");
      return false;
    }
    medium[id] = lb;
  }
  return true;
}

int parseParams(const char* docname, LUMPPARAMS &params) {
  params = LUMPPARAMS();
  xmlDocPtr doc = openDoc(docname, "lumpgem");
  if(doc == NULL) { return LOAD_FAILED; }

  bool ok(true), haveUptake(false), haveGrowth(false);
  xmlNodePtr cur = xmlDocGetRootElement(doc)->xmlChildrenNode;
  while (cur != NULL) {
    bool good(true);
    if(cur->type != XML_ELEMENT_NODE) { cur = cur->next; continue; }
    string text = nodeText(doc, cur);
    if ((!xmlStrcmp(cur->name, (const xmlChar *)"model"))) { params.modelFile = text; }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"thermodb"))) { params.thermoFile = text; }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"output"))) { params.outputFile = text; }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"biomass_rxn"))) { params.biomassRxns.push_back(text); }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"core_subsystem"))) { params.coreSubsystems.push_back(text); }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"objective_rxn"))) { params.objectiveRxn = text; }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"carbon_uptake"))) {
      params.carbonUptake = parseDouble(text, good);
      haveUptake = good;
    }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"growth_rate"))) {
      if(text == "auto" || text == "AUTO") { params.autoGrowth = true; }
      else { params.growthRate = parseDouble(text, good); }
      haveGrowth = good;
    }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"timeout"))) { params.timeout = parseDouble(text, good); }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"feasibility"))) { params.feasibility = parseDouble(text, good); }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"mip_gap"))) { params.mipGap = parseDouble(text, good); }
    else if ((!xmlStrcmp(cur->name, (const xmlChar *)"medium"))) {
      if(!parseMEDIUM(doc, cur, params.medium)) { ok = false; }
    }
    else {
      printf("WARNING: Unknown parameter <%s> ignored\n", (const char*)cur->name);
    }
    if(!good) {
      printf("ERROR: <%s> needs a number, got \"%s\"\n", (const char*)cur->name, text.c_str());
      ok = false;
    }
    cur = cur->next;
  }
  xmlFreeDoc(doc);

  if(params.modelFile.empty()) { printf("ERROR: No <model> given in %s\n", docname); ok = false; }
  if(params.thermoFile.empty()) { printf("ERROR: No <thermodb> given in %s\n", docname); ok = false; }
  if(params.biomassRxns.empty()) { printf("ERROR: No <biomass_rxn> given in %s\n", docname); ok = false; }
  if(!haveUptake) { printf("ERROR: No <carbon_uptake> given in %s\n", docname); ok = false; }
  if(!haveGrowth) { printf("ERROR: No <growth_rate> given in %s\n", docname); ok = false; }
  if(haveUptake && params.carbonUptake < 0.0f) { printf("ERROR: <carbon_uptake> must not be negative\n"); ok = false; }
  /* GLPK stops the whole program on out-of-range control parameters */
  if(!(params.timeout > 0.0f)) { printf("ERROR: <timeout> must be positive, got %g\n", params.timeout); ok = false; }
  if(!(params.feasibility > 0.0f && params.feasibility < 1.0f)) {
    printf("ERROR: <feasibility> must be between 0 and 1, got %g\n", params.feasibility);
    ok = false;
  }
  if(!(params.mipGap >= 0.0f)) { printf("ERROR: <mip_gap> must not be negative, got %g\n", params.mipGap); ok = false; }

  if(!ok) { return LOAD_FAILED; }
  if(params.outputFile.empty()) { params.outputFile = "LUMPS_out"; }
  return LOAD_SUCCESS;
}
