/**
 * @file schema_migrations.cpp
 * @brief Migration procedures of the equipment inspection schema
 */

#include <equipdb/storage/schema_migrations.hpp>

#include <equipdb/storage/database_connection.hpp>

#include <sqlite3.h>

namespace equipdb::storage {

namespace {

// ============================================================================
// Migration Implementations
// ============================================================================

auto migrate_v1(sqlite3* db) -> VoidResult {
    // V1: Initial schema
    const char* sql = R"(
        -- =====================================================================
        -- EQUIPMENT TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS equipment (
            id                INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id      TEXT UNIQUE,
            type              TEXT,
            manufacturer      TEXT,
            model             TEXT,
            serial_number     TEXT,
            capacity          REAL,
            installation_date TEXT,
            location          TEXT,
            status            TEXT,
            qr_code_data      TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_equipment_id ON equipment(equipment_id);

        -- =====================================================================
        -- INSPECTIONS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS inspections (
            id                 INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id       INTEGER REFERENCES equipment(id),
            inspector          TEXT,
            inspection_date    TEXT,
            findings           TEXT,
            corrective_actions TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_inspections_equipment_id ON inspections(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_inspections_date ON inspections(inspection_date);

        -- =====================================================================
        -- DOCUMENTS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS documents (
            id           INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id INTEGER REFERENCES equipment(id),
            file_name    TEXT,
            file_path    TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_documents_equipment_id ON documents(equipment_id);

        -- =====================================================================
        -- SCHEDULED INSPECTIONS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS scheduled_inspections (
            id                 INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id       INTEGER REFERENCES equipment(id),
            scheduled_date     TEXT,
            assigned_inspector TEXT,
            status             TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_scheduled_inspections_equipment_id
            ON scheduled_inspections(equipment_id);

        -- =====================================================================
        -- COMPLIANCE TABLES
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS compliance_standards (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            name        TEXT,
            description TEXT,
            authority   TEXT
        );

        CREATE TABLE IF NOT EXISTS equipment_type_compliance (
            equipment_type TEXT,
            standard_id    INTEGER REFERENCES compliance_standards(id),
            PRIMARY KEY (equipment_type, standard_id)
        );

        -- =====================================================================
        -- INSPECTION TEMPLATES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS inspection_templates (
            id     INTEGER PRIMARY KEY AUTOINCREMENT,
            name   TEXT UNIQUE,
            fields TEXT
        );
    )";

    return execute_sql(db, sql);
}

auto migrate_v2(sqlite3* db) -> VoidResult {
    // V2: Structured inspections and deficiency tracking
    const char* sql = R"(
        ALTER TABLE inspections ADD COLUMN summary_comments TEXT;
        ALTER TABLE inspections ADD COLUMN signature TEXT;
        ALTER TABLE inspections ADD COLUMN scheduled_inspection_id INTEGER
            REFERENCES scheduled_inspections(id);
        ALTER TABLE inspections ADD COLUMN inspection_date_date TEXT;

        UPDATE inspections SET inspection_date_date = date(inspection_date)
            WHERE inspection_date IS NOT NULL;

        CREATE INDEX IF NOT EXISTS idx_inspections_date_date
            ON inspections(inspection_date_date);
        CREATE INDEX IF NOT EXISTS idx_inspections_scheduled
            ON inspections(scheduled_inspection_id);

        ALTER TABLE documents ADD COLUMN hash TEXT;
        ALTER TABLE documents ADD COLUMN size INTEGER;

        -- =====================================================================
        -- INSPECTION ITEMS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS inspection_items (
            id            INTEGER PRIMARY KEY AUTOINCREMENT,
            inspection_id INTEGER NOT NULL REFERENCES inspections(id)
                          ON DELETE CASCADE,
            standard_ref  TEXT,
            item_text     TEXT NOT NULL,
            critical      INTEGER NOT NULL DEFAULT 0,
            result        TEXT NOT NULL,
            notes         TEXT,
            photos        TEXT,
            component     TEXT,
            priority      TEXT,
            created_at    TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (result IN ('pass', 'fail', 'na'))
        );

        CREATE INDEX IF NOT EXISTS idx_inspection_items_inspection
            ON inspection_items(inspection_id);
        CREATE INDEX IF NOT EXISTS idx_inspection_items_result
            ON inspection_items(result, critical);

        -- =====================================================================
        -- DEFICIENCIES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS deficiencies (
            id                     INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id           INTEGER NOT NULL REFERENCES equipment(id),
            inspection_item_id     INTEGER REFERENCES inspection_items(id),
            severity               TEXT NOT NULL,
            remove_from_service    INTEGER NOT NULL DEFAULT 0,
            description            TEXT NOT NULL,
            component              TEXT,
            corrective_action      TEXT,
            due_date               TEXT,
            status                 TEXT NOT NULL DEFAULT 'open',
            verification_signature TEXT,
            verification_timestamp TEXT,
            created_at             TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            updated_at             TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            closed_at              TEXT,
            CHECK (severity IN ('critical', 'major', 'minor')),
            CHECK (status IN ('open', 'in_progress', 'verified', 'closed'))
        );

        CREATE INDEX IF NOT EXISTS idx_deficiencies_equipment ON deficiencies(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_deficiencies_status ON deficiencies(status);
        CREATE INDEX IF NOT EXISTS idx_deficiencies_due ON deficiencies(due_date);

        -- =====================================================================
        -- SIGNATURES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS signatures (
            id             INTEGER PRIMARY KEY AUTOINCREMENT,
            entity_type    TEXT NOT NULL,
            entity_id      INTEGER NOT NULL,
            signature_type TEXT NOT NULL,
            signatory_name TEXT NOT NULL,
            signature_data TEXT NOT NULL,
            timestamp      TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (entity_type IN ('inspection', 'deficiency', 'work_order')),
            CHECK (signature_type IN ('inspector', 'supervisor', 'verification'))
        );

        CREATE INDEX IF NOT EXISTS idx_signatures_entity
            ON signatures(entity_type, entity_id);
    )";

    return execute_sql(db, sql);
}

auto migrate_v3(sqlite3* db) -> VoidResult {
    // V3: Maintenance management
    const char* sql = R"(
        -- =====================================================================
        -- WORK ORDERS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS work_orders (
            id               INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id     INTEGER NOT NULL REFERENCES equipment(id),
            wo_number        TEXT NOT NULL UNIQUE,
            title            TEXT NOT NULL,
            description      TEXT,
            work_type        TEXT NOT NULL,
            priority         TEXT NOT NULL,
            status           TEXT NOT NULL DEFAULT 'draft',
            assigned_to      TEXT,
            estimated_hours  REAL,
            actual_hours     REAL,
            parts_cost       REAL,
            labor_cost       REAL,
            created_by       TEXT NOT NULL,
            scheduled_date   TEXT,
            started_at       TEXT,
            completed_at     TEXT,
            closed_at        TEXT,
            completion_notes TEXT,
            deficiency_id    INTEGER REFERENCES deficiencies(id),
            created_at       TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (work_type IN ('preventive', 'corrective', 'emergency', 'project')),
            CHECK (priority IN ('low', 'medium', 'high', 'critical')),
            CHECK (status IN ('draft', 'approved', 'assigned', 'in_progress',
                              'completed', 'closed', 'cancelled'))
        );

        CREATE INDEX IF NOT EXISTS idx_work_orders_equipment ON work_orders(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_work_orders_status ON work_orders(status);
        CREATE INDEX IF NOT EXISTS idx_work_orders_scheduled ON work_orders(scheduled_date);

        -- =====================================================================
        -- PREVENTIVE MAINTENANCE TABLES
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS pm_templates (
            id                 INTEGER PRIMARY KEY AUTOINCREMENT,
            name               TEXT NOT NULL,
            equipment_type     TEXT NOT NULL,
            description        TEXT,
            frequency_type     TEXT NOT NULL,
            frequency_value    INTEGER NOT NULL,
            frequency_unit     TEXT,
            estimated_duration REAL,
            instructions       TEXT,
            required_skills    TEXT,
            required_parts     TEXT,
            safety_notes       TEXT,
            active             INTEGER NOT NULL DEFAULT 1,
            created_at         TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            updated_at         TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (frequency_type IN ('calendar', 'usage', 'condition')),
            CHECK (frequency_value > 0)
        );

        CREATE INDEX IF NOT EXISTS idx_pm_templates_type ON pm_templates(equipment_type);

        CREATE TABLE IF NOT EXISTS pm_schedules (
            id                   INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id         INTEGER NOT NULL REFERENCES equipment(id),
            pm_template_id       INTEGER NOT NULL REFERENCES pm_templates(id),
            next_due_date        TEXT,
            next_due_usage       REAL,
            last_completed_date  TEXT,
            last_completed_usage REAL,
            active               INTEGER NOT NULL DEFAULT 1,
            created_at           TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_pm_schedules_equipment ON pm_schedules(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_pm_schedules_due ON pm_schedules(next_due_date);

        -- =====================================================================
        -- METER READINGS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS meter_readings (
            id            INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id  INTEGER NOT NULL REFERENCES equipment(id),
            meter_type    TEXT NOT NULL,
            reading_value REAL NOT NULL,
            reading_date  TEXT NOT NULL,
            recorded_by   TEXT NOT NULL,
            notes         TEXT,
            created_at    TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_meter_readings_equipment
            ON meter_readings(equipment_id, meter_type);

        ALTER TABLE deficiencies ADD COLUMN work_order_id INTEGER
            REFERENCES work_orders(id);
    )";

    return execute_sql(db, sql);
}

auto migrate_v4(sqlite3* db) -> VoidResult {
    // V4: Testing, calibration and personnel qualification
    const char* sql = R"(
        -- =====================================================================
        -- LOAD TESTS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS load_tests (
            id                   INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id         INTEGER NOT NULL REFERENCES equipment(id),
            test_date            TEXT NOT NULL,
            test_type            TEXT NOT NULL,
            test_load_percentage REAL,
            rated_capacity       REAL,
            test_load            REAL,
            test_duration        TEXT,
            inspector            TEXT NOT NULL,
            test_results         TEXT NOT NULL,
            deficiencies_found   TEXT,
            corrective_actions   TEXT,
            next_test_due        TEXT,
            certificate_number   TEXT,
            notes                TEXT,
            created_at           TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (test_type IN ('annual', 'periodic', 'initial', 'after_repair')),
            CHECK (test_results IN ('pass', 'fail'))
        );

        CREATE INDEX IF NOT EXISTS idx_load_tests_equipment ON load_tests(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_load_tests_due ON load_tests(next_test_due);

        -- =====================================================================
        -- CALIBRATIONS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS calibrations (
            id                   INTEGER PRIMARY KEY AUTOINCREMENT,
            equipment_id         INTEGER NOT NULL REFERENCES equipment(id),
            instrument_type      TEXT NOT NULL,
            calibration_date     TEXT NOT NULL,
            calibration_due_date TEXT NOT NULL,
            calibrated_by        TEXT NOT NULL,
            calibration_agency   TEXT,
            certificate_number   TEXT,
            calibration_results  TEXT NOT NULL,
            accuracy_tolerance   TEXT,
            actual_accuracy      TEXT,
            adjustments_made     TEXT,
            notes                TEXT,
            created_at           TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (calibration_results IN ('pass', 'fail', 'limited'))
        );

        CREATE INDEX IF NOT EXISTS idx_calibrations_equipment ON calibrations(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_calibrations_due ON calibrations(calibration_due_date);

        -- =====================================================================
        -- CREDENTIALS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS credentials (
            id                 INTEGER PRIMARY KEY AUTOINCREMENT,
            person_name        TEXT NOT NULL,
            credential_type    TEXT NOT NULL,
            equipment_types    TEXT,
            certification_body TEXT,
            certificate_number TEXT,
            issue_date         TEXT NOT NULL,
            expiration_date    TEXT NOT NULL,
            renewal_required   INTEGER NOT NULL DEFAULT 0,
            status             TEXT NOT NULL DEFAULT 'active',
            notes              TEXT,
            created_at         TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            updated_at         TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (status IN ('active', 'expired', 'suspended', 'revoked'))
        );

        CREATE INDEX IF NOT EXISTS idx_credentials_person ON credentials(person_name);
        CREATE INDEX IF NOT EXISTS idx_credentials_expiration ON credentials(expiration_date);

        -- =====================================================================
        -- TEMPLATE ITEMS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS template_items (
            id                  INTEGER PRIMARY KEY AUTOINCREMENT,
            template_id         INTEGER NOT NULL REFERENCES inspection_templates(id)
                                ON DELETE CASCADE,
            standard_id         INTEGER REFERENCES compliance_standards(id),
            item_order          INTEGER NOT NULL,
            standard_ref        TEXT,
            item_text           TEXT NOT NULL,
            critical            INTEGER NOT NULL DEFAULT 0,
            component           TEXT,
            inspection_method   TEXT,
            acceptance_criteria TEXT,
            notes               TEXT,
            CHECK (item_order > 0)
        );

        CREATE INDEX IF NOT EXISTS idx_template_items_template
            ON template_items(template_id, item_order);
    )";

    return execute_sql(db, sql);
}

auto migrate_v5(sqlite3* db) -> VoidResult {
    // V5: Users, audit trail and certificates
    const char* sql = R"(
        -- =====================================================================
        -- USERS TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS users (
            id         INTEGER PRIMARY KEY AUTOINCREMENT,
            username   TEXT NOT NULL UNIQUE,
            full_name  TEXT NOT NULL,
            email      TEXT,
            role       TEXT NOT NULL,
            active     INTEGER NOT NULL DEFAULT 1,
            last_login TEXT,
            created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (role IN ('admin', 'inspector', 'reviewer', 'viewer'))
        );

        -- =====================================================================
        -- AUDIT LOG TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS audit_log (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id     INTEGER REFERENCES users(id),
            username    TEXT NOT NULL,
            action      TEXT NOT NULL,
            entity_type TEXT NOT NULL,
            entity_id   INTEGER NOT NULL,
            old_values  TEXT,
            new_values  TEXT,
            ip_address  TEXT,
            user_agent  TEXT,
            timestamp   TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        );

        CREATE INDEX IF NOT EXISTS idx_audit_log_entity
            ON audit_log(entity_type, entity_id);
        CREATE INDEX IF NOT EXISTS idx_audit_log_timestamp ON audit_log(timestamp);

        -- =====================================================================
        -- CERTIFICATES TABLE
        -- =====================================================================
        CREATE TABLE IF NOT EXISTS certificates (
            id                 INTEGER PRIMARY KEY AUTOINCREMENT,
            certificate_number TEXT NOT NULL UNIQUE,
            certificate_type   TEXT NOT NULL,
            equipment_id       INTEGER NOT NULL REFERENCES equipment(id),
            entity_id          INTEGER NOT NULL,
            issue_date         TEXT NOT NULL,
            expiration_date    TEXT,
            issued_by          TEXT NOT NULL,
            qr_code_data       TEXT,
            certificate_hash   TEXT,
            status             TEXT NOT NULL DEFAULT 'active',
            created_at         TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP,
            CHECK (certificate_type IN ('inspection', 'load_test', 'calibration')),
            CHECK (status IN ('active', 'expired', 'revoked'))
        );

        CREATE INDEX IF NOT EXISTS idx_certificates_equipment ON certificates(equipment_id);
        CREATE INDEX IF NOT EXISTS idx_certificates_expiration
            ON certificates(expiration_date);
    )";

    return execute_sql(db, sql);
}

}  // namespace

auto application_migrations() -> const migration_set& {
    static const migration_set migrations{
        {1, "Initial schema", migrate_v1},
        {2, "Inspection items, deficiencies and signatures", migrate_v2},
        {3, "Work orders, preventive maintenance and meter readings", migrate_v3},
        {4, "Load tests, calibrations, credentials and template items", migrate_v4},
        {5, "Users, audit log and certificates", migrate_v5},
    };
    return migrations;
}

}  // namespace equipdb::storage
