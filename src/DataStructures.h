// Data structures used throughout the project

#ifndef _DATASTRUCTURES_H
#define _DATASTRUCTURES_H

#include <algorithm>
#include <climits>
#include <map>
#include <set>
#include <string>
#include <vector>

using std::vector;
using std::map;
using std::set;
using std::string;

/* Status codes returned by the loaders */
#define LOAD_SUCCESS      0
#define LOAD_UNSUPPORTED  1
#define LOAD_FAILED       2

/* Status codes returned by the solver and everything that calls it */
#define SOLVE_SUCCESS     0
#define SOLVE_INFEASIBLE  1
#define SOLVE_UNBOUNDED   2
#define SOLVE_NUMERICAL   3
#define SOLVE_TIMEOUT     4
/* The caller asked for something the problem does not have (unknown reaction, duplicate constraint...) */
#define SOLVE_BAD_INPUT   5

/* Input data classes */
class STOICH;
class REACTION;
class METABOLITE;
class RXNSPACE;
class METSPACE;
class MODEL;

class THERMOCOMPOUND;
class THERMODB;

class PARTITION;
class NETREACTION;
class SOLUTION;
class LUMPPARAMS;

class RXNSPACE{
 public:
  vector<REACTION> rxns;

  RXNSPACE();
  RXNSPACE(const vector<REACTION> &rxnVec);

  void clear();

  void change_Lb(int id, double new_lb);

  void addReaction(const REACTION &rxn);
  REACTION* rxnPtrFromId(int id);
  const REACTION* rxnPtrFromId(int id) const;
  int idxFromId(int id) const;
  /* Returns -1 if no reaction has that name */
  int idFromName(const string &name) const;
  bool idIn(int id) const;
  bool nameIn(const string &name) const;

  RXNSPACE& operator=(const RXNSPACE& init);

 private:
  map<int,int> Ids2Idx;
  map<string,int> Names2Ids;
};

class METSPACE{
 public:
  vector<METABOLITE> mets;

  METSPACE();
  METSPACE(const vector<METABOLITE> &metVec);

  void clear();
  void addMetabolite(const METABOLITE &met);
  METABOLITE* metPtrFromId(int id);
  const METABOLITE* metPtrFromId(int id) const;
  int idxFromId(int id) const;
  int idFromName(const string &name) const;
  bool idIn(int id) const;
  bool nameIn(const string &name) const;

  METSPACE& operator=(const METSPACE& init);

 private:
  map<int, int> Ids2Idx;
  map<string, int> Names2Ids;
};

/* A loaded metabolic network. Reaction and metabolite IDs are assigned by the loader
   (0, 1, 2, ... in file order); names are the identifiers used in the model file */
class MODEL{
 public:
  string name;
  RXNSPACE rxns;
  METSPACE metabolites;

  MODEL();
  void clear();
};

class STOICH{
  public:
  int met_id;
  double rxn_coeff;
  string met_name;

  bool operator==(const STOICH &rhs) const;
  bool operator<(const STOICH &rhs) const;
  STOICH();
};

class METABOLITE{
 public:
  /* Externally (model file) defined parameters */
  int id;
  string name;
  string longname;
  string compartment;
  string chemform;
  int charge;
  /* Key used to look the metabolite up in the thermodynamic database (empty = use the name without compartment) */
  string seed_id;
  /* Boundary metabolites are not mass balanced */
  bool boundary;

  /* Filled in by TFAMODEL::prepare() */
  bool hasThermo;
  double deltaGf;     /* kJ/mol */
  double deltaGf_err; /* kJ/mol */

  METABOLITE();
};

class THERMORXN{
 public:
  double deltaGR;    /* kJ/mol */
  double deltaGRerr; /* kJ/mol */
  /* Only reactions with computed = true get thermodynamic constraints in TFAMODEL::convert() */
  bool computed;
  THERMORXN();
};

class REACTION{
 public:

  int id;
  string name;
  string longname;
  string subsystem;
  vector<STOICH> stoich; /* Full chemical reaction */
  double lb;  double ub;
  THERMORXN thermo;

  /* Reactions with either no reactants or no products (exchanges, demands, sinks, most biomass reactions) */
  bool isBoundary() const;
  double coeffOf(int met_id) const;

  REACTION();
};

/* Aggregate of several reactions. rxn.stoich holds the combined stoichiometry;
   rxnIds / rxnFluxes list the reactions that contributed and the flux each one was weighted with */
class NETREACTION{
 public:
  vector<int> rxnIds;
  vector<double> rxnFluxes;
  REACTION rxn;
  bool operator==(const NETREACTION &rhs) const;
};

/* Reaction IDs split into the three sets used for lumping.
   Every reaction in the model is in exactly one of biomass, core and noncore */
class PARTITION{
 public:
  set<int> biomass;
  set<int> core;
  set<int> noncore;
  /* Metabolite IDs touched by at least one core reaction */
  set<int> coreMets;

  void clear();
  int size() const;
};

class THERMOCOMPOUND{
 public:
  string id;
  string formula;
  int charge_std;
  double deltaGf_std; /* kJ/mol */
  double deltaGf_err; /* kJ/mol */
  THERMOCOMPOUND();
};

class THERMODB{
 public:
  string name;
  string units;
  map<string, THERMOCOMPOUND> compounds;

  bool hasCompound(const string &id) const;
  const THERMOCOMPOUND* compound(const string &id) const;
  void clear();
};

/* Primal solution of one solve. Read-only for anyone but the solver */
class SOLUTION{
 public:
  int status;
  double objective;
  /* Reaction name -> net flux (forward - reverse) */
  map<string, double> fluxes;
  /* Variable name -> primal value */
  map<string, double> primals;

  SOLUTION();
  void clear();
  /* Lookups return 0 for names the solver did not report */
  double flux(const string &rxnName) const;
  double primal(const string &varName) const;
};

class LUMPPARAMS{
 public:
  string modelFile;
  string thermoFile;
  string outputFile;
  vector<string> biomassRxns;
  vector<string> coreSubsystems;
  /* Reaction name -> new lower bound */
  map<string, double> medium;
  /* Atoms per unit time */
  double carbonUptake;
  /* 1/time; ignored if autoGrowth is set */
  double growthRate;
  bool autoGrowth;
  /* Reaction maximised to compute the automatic growth rate (defaults to the first biomass reaction) */
  string objectiveRxn;
  double timeout;
  double feasibility;
  double mipGap;

  LUMPPARAMS();
};

#endif // _DATASTRUCTURES_H
