#pragma once

#include <cstddef>
#include <cstdint>

// Launcher invocation, argv[0] is looked up on PATH.
inline const char* const TASKFARM_LAUNCHER_PROGRAM = "srun";
inline const char* const TASKFARM_MULTI_PROG_FLAG = "--multi-prog";
inline const char* const TASKFARM_CPUS_PER_TASK_FLAG = "--cpus-per-task";
inline const char* const TASKFARM_CPU_BIND_FLAG = "--cpu-bind=cores";
inline const char* const TASKFARM_THREADS_ENV = "OMP_NUM_THREADS";

// Slot contents
inline const char* const TASKFARM_NOOP_COMMAND = "true";
inline const char* const TASKFARM_SLOT_SHELL = "/bin/bash";
inline const char* const TASKFARM_SLOT_WILDCARD = "%t";
inline const char* const TASKFARM_TEMPLATE_PLACEHOLDER = "{}";
inline const char TASKFARM_COMMENT_MARKER = '#';
inline const double TASKFARM_DELAY_INCREMENT = 0.1;

// Work directory layout: <scratch>/taskfarm.<allocation id>/
inline const char* const TASKFARM_WORK_DIR_PREFIX = "taskfarm.";
inline const char* const TASKFARM_DEFAULT_SCRATCH_DIR = "/tmp";
inline const char* const TASKFARM_SLOT_SCRIPT_PATTERN = "slot_{}.sh";
inline const char* const TASKFARM_FILE_MODE_CONFIG = "multiprog.conf";
inline const char* const TASKFARM_ROUND_CONFIG_PATTERN = "round_{}.conf";
inline const char* const TASKFARM_MANIFEST_FILE = "manifest.json";

// Execution environment
inline const char* const TASKFARM_ENV_JOB_ID = "SLURM_JOB_ID";
inline const char* const TASKFARM_ENV_NTASKS = "SLURM_NTASKS";
inline const char* const TASKFARM_ENV_NPROCS = "SLURM_NPROCS";
inline const char* const TASKFARM_ENV_CPUS_ON_NODE = "SLURM_CPUS_ON_NODE";
inline const char* const TASKFARM_ENV_JOB_NODELIST = "SLURM_JOB_NODELIST";
inline const char* const TASKFARM_ENV_NODELIST = "SLURM_NODELIST";
inline const char* const TASKFARM_ENV_SCRATCH_DIR = "TMPDIR";
inline const char* const TASKFARM_ENV_SUBMIT_DIR = "SLURM_SUBMIT_DIR";
inline const char* const TASKFARM_ENV_CONFIG = "TASKFARM_CONFIG";

inline const int32_t TASKFARM_PRECONDITION_EXIT_CODE = 1;
