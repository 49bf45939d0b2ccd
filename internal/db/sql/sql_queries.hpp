#pragma once

namespace catalog::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  Written with sqlite '?' placeholders; the postgres store numbers them
  ($1, $2, ...) before execution.
*/

// project

static constexpr const char* INSERT_PROJECT =
    "INSERT INTO project(project_id,project_name) VALUES(?,?);";

static constexpr const char* SELECT_PROJECT_EXISTS =
    "SELECT 1 FROM project WHERE project_id=?;";

// warehouse

static constexpr const char* INSERT_WAREHOUSE =
    "INSERT INTO warehouse(warehouse_id,warehouse_name,project_id,storage_profile,storage_secret_id,"
    "status,tabular_delete_mode,tabular_expiration_seconds,protected,version)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_WAREHOUSE_GUARDS =
    "SELECT protected,"
    " EXISTS(SELECT 1 FROM task t WHERE t.warehouse_id=w.warehouse_id),"
    " EXISTS(SELECT 1 FROM namespace n WHERE n.warehouse_id=w.warehouse_id)"
    " FROM warehouse w WHERE w.warehouse_id=?;";

static constexpr const char* DELETE_WAREHOUSE_NAMESPACES =
    "DELETE FROM namespace WHERE warehouse_id=?;";

static constexpr const char* DELETE_WAREHOUSE =
    "DELETE FROM warehouse WHERE warehouse_id=?;";

static constexpr const char* RENAME_ACTIVE_WAREHOUSE =
    "UPDATE warehouse SET warehouse_name=?,version=version+1"
    " WHERE warehouse_id=? AND status='active';";

static constexpr const char* UPDATE_WAREHOUSE_STATUS =
    "UPDATE warehouse SET status=?,version=version+1 WHERE warehouse_id=?;";

static constexpr const char* UPDATE_WAREHOUSE_PROTECTED =
    "UPDATE warehouse SET protected=?,version=version+1 WHERE warehouse_id=?;";

static constexpr const char* BUMP_WAREHOUSE_VERSION =
    "UPDATE warehouse SET version=version+1 WHERE warehouse_id=?;";

// Reads carry a project-exists flag so dangling references surface as
// integrity errors instead of silently disappearing.
static constexpr const char* SELECT_WAREHOUSES_BY_PROJECT =
    "SELECT w.warehouse_id,w.warehouse_name,w.project_id,w.storage_profile,w.storage_secret_id,"
    "w.status,w.tabular_delete_mode,w.tabular_expiration_seconds,w.protected,w.version,"
    " EXISTS(SELECT 1 FROM project p WHERE p.project_id=w.project_id)"
    " FROM warehouse w WHERE w.project_id=? ORDER BY w.warehouse_name,w.warehouse_id;";

static constexpr const char* SELECT_WAREHOUSE_BY_ID =
    "SELECT w.warehouse_id,w.warehouse_name,w.project_id,w.storage_profile,w.storage_secret_id,"
    "w.status,w.tabular_delete_mode,w.tabular_expiration_seconds,w.protected,w.version,"
    " EXISTS(SELECT 1 FROM project p WHERE p.project_id=w.project_id)"
    " FROM warehouse w WHERE w.warehouse_id=?;";

// namespaces / tasks

static constexpr const char* INSERT_NAMESPACE =
    "INSERT INTO namespace(warehouse_id,namespace_name) VALUES(?,?);";

static constexpr const char* INSERT_TASK =
    "INSERT INTO task(task_id,warehouse_id) VALUES(?,?);";

static constexpr const char* DELETE_TASK_RETURNING_WAREHOUSE =
    "DELETE FROM task WHERE task_id=? RETURNING warehouse_id;";

}
