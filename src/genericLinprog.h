#include <glpk.h>
#include <vector>
#include "DataStructures.h"
#include "Variables.h"
#include "Constraints.h"

#ifndef GENERICLINPROG_H
#define GENERICLINPROG_H

#define SENSE_MIN -1
#define SENSE_MAX  1

class SOLVERPARAMS {
 public:
  double timeout;     /* Seconds */
  double feasibility; /* Integer feasibility tolerance */
  double mipGap;      /* Relative MIP gap */
  SOLVERPARAMS();
};

/* Mixed-integer problem held in our own containers (so that variables and constraints can come and go
   between solves) and handed to GLPK only when solving. Each solve builds a fresh glp_prob.

   Not safe to modify from more than one thread, and not copyable. */
class GLPKMILP {
 public:
  GLPKMILP();
  ~GLPKMILP();

  /* Return false (and print an ERROR) if the name is already taken or the constraint refers to an unknown variable */
  bool addVariable(const GENERICVARIABLE &var);
  bool addConstraint(const GENERICCONSTRAINT &cons);
  /* Return false if there was nothing with that name */
  bool removeVariable(const string &name);
  bool removeConstraint(const string &name);
  /* Batch versions. Return the names that were not in the problem */
  vector<string> removeVariables(const vector<string> &names);
  vector<string> removeConstraints(const vector<string> &names);
  bool hasVariable(const string &name) const;
  bool hasConstraint(const string &name) const;
  vector<string> variablesWithPrefix(const string &prefix) const;
  vector<string> constraintsWithPrefix(const string &prefix) const;

  int numVariables() const;
  int numConstraints() const;
  int numIntegerVariables() const;

  void setObjective(const LINEXPR &expr, int sense);
  const LINEXPR& objective() const;
  int objectiveSense() const;

  void setParams(const SOLVERPARAMS &newParams);

  /* Solve routines. Returns one of the SOLVE_* codes; primals and objValue are only filled on SOLVE_SUCCESS */
  int solve(map<string, double> &primals, double &objValue);
  void printPrivateStuff();

 private:
  class MILPCOLUMN {
  public:
    string name;
    double lb;
    double ub;
    int kind;
  };
  class MILPROW {
  public:
    string name;
    LINEXPR expr;
    double lb;
    double ub;
  };

  vector<MILPCOLUMN> cols;
  vector<MILPROW> rows;
  map<string, int> colIdx;
  map<string, int> rowIdx;

  LINEXPR obj;
  int objSense; /* -1 = MIN, 1 = MAX */
  SOLVERPARAMS params;

  glp_prob* problem;

  /* Not implemented - there is only ever one owner of a problem */
  GLPKMILP(const GLPKMILP &);
  GLPKMILP& operator=(const GLPKMILP &);

  void reindexColumns();
  void reindexRows();
  void validateSense(int sense);
  void setUpProblem();
  int solveLp(map<string, double> &primals, double &objValue);
  int solveMilp(map<string, double> &primals, double &objValue);
  int statusFromGlpk(int errorCode);
  void reportFailure(int errorCode);

  void printGlpkError(int errorCode);

  /* This has to be declared as static because we're making a function pointer to it */
  static int suppressGLPKOutput(void *info, const char *s);
};

#endif
