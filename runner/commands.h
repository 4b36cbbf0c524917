#pragma once

int cmd_analyze(int argc, char** argv);
int cmd_evaluate(int argc, char** argv);
int cmd_audit(int argc, char** argv);
int cmd_review(int argc, char** argv);
int cmd_pending(int argc, char** argv);
int cmd_stats(int argc, char** argv);
int cmd_history(int argc, char** argv);
int cmd_serve(int argc, char** argv);
