#include "config/settings.hpp"

#include "logging/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

#include <limits>

namespace mend {
namespace {

Error config_error(const QString& key, const QString& why) {
    return Error{(QStringLiteral("invalid value for '%1': %2").arg(key, why)).toStdString(),
                 ErrorKind::Config};
}

// Numbers may arrive as JSON numbers or as numeric strings.
Result<int, Error> int_from_json(const QString& key, const QJsonValue& value) {
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
            return Result<int, Error>::err(config_error(key, QStringLiteral("out of range")));
        }
        if (d != static_cast<double>(static_cast<int>(d))) {
            return Result<int, Error>::err(config_error(key, QStringLiteral("not an integer")));
        }
        return Result<int, Error>::ok(static_cast<int>(d));
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (!ok) {
            return Result<int, Error>::err(config_error(key, QStringLiteral("not an integer")));
        }
        return Result<int, Error>::ok(parsed);
    }
    return Result<int, Error>::err(config_error(key, QStringLiteral("expected a number")));
}

Result<double, Error> double_from_json(const QString& key, const QJsonValue& value) {
    if (value.isDouble()) {
        return Result<double, Error>::ok(value.toDouble());
    }
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (!ok) {
            return Result<double, Error>::err(config_error(key, QStringLiteral("not a number")));
        }
        return Result<double, Error>::ok(parsed);
    }
    return Result<double, Error>::err(config_error(key, QStringLiteral("expected a number")));
}

Result<std::string, Error> string_from_json(const QString& key, const QJsonValue& value) {
    if (!value.isString()) {
        return Result<std::string, Error>::err(config_error(key, QStringLiteral("expected a string")));
    }
    return Result<std::string, Error>::ok(value.toString().toStdString());
}

Status assign_int(int& target, const QString& key, const QJsonValue& value) {
    auto parsed = int_from_json(key, value);
    if (parsed.is_err()) return Status::err(parsed.unwrap_err());
    target = parsed.unwrap();
    return Status::ok();
}

Status assign_string(std::string& target, const QString& key, const QJsonValue& value) {
    auto parsed = string_from_json(key, value);
    if (parsed.is_err()) return Status::err(parsed.unwrap_err());
    target = parsed.unwrap();
    return Status::ok();
}

// Applies every known key present in `obj`. Unknown keys are ignored.
Status apply_object(Settings& settings, const QJsonObject& obj) {
    for (const auto* key : {"api_key", "openai_api_key"}) {
        const auto value = obj.value(QLatin1String(key));
        if (value.isUndefined() || value.isNull()) continue;
        auto parsed = string_from_json(QLatin1String(key), value);
        if (parsed.is_err()) return Status::err(parsed.unwrap_err());
        if (!parsed.unwrap().empty()) {
            settings.api_key = parsed.unwrap();
        }
    }

    const auto has = [&obj](const char* key) {
        const auto value = obj.value(QLatin1String(key));
        return !value.isUndefined() && !value.isNull();
    };

    if (has("model")) {
        auto s = assign_string(settings.model, QStringLiteral("model"), obj.value(QStringLiteral("model")));
        if (s.is_err()) return s;
    }
    if (has("api_url")) {
        auto s = assign_string(settings.api_url, QStringLiteral("api_url"), obj.value(QStringLiteral("api_url")));
        if (s.is_err()) return s;
    }
    if (has("max_retries")) {
        auto s = assign_int(settings.max_retries, QStringLiteral("max_retries"),
                            obj.value(QStringLiteral("max_retries")));
        if (s.is_err()) return s;
    }
    if (has("timeout_seconds")) {
        auto s = assign_int(settings.timeout_seconds, QStringLiteral("timeout_seconds"),
                            obj.value(QStringLiteral("timeout_seconds")));
        if (s.is_err()) return s;
    }
    if (has("context_lines")) {
        auto s = assign_int(settings.context_lines, QStringLiteral("context_lines"),
                            obj.value(QStringLiteral("context_lines")));
        if (s.is_err()) return s;
    }
    if (has("retry_delay_ms")) {
        auto s = assign_int(settings.retry_delay_ms, QStringLiteral("retry_delay_ms"),
                            obj.value(QStringLiteral("retry_delay_ms")));
        if (s.is_err()) return s;
    }
    if (has("temperature")) {
        auto parsed = double_from_json(QStringLiteral("temperature"), obj.value(QStringLiteral("temperature")));
        if (parsed.is_err()) return Status::err(parsed.unwrap_err());
        settings.temperature = parsed.unwrap();
    }
    return Status::ok();
}

Status apply_file(Settings& settings, const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        qCDebug(mendConfigLog) << "config file not present:" << path;
        return Status::ok();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return Status::err(Error{("cannot read config file " + path + ": " + file.errorString()).toStdString(),
                                 ErrorKind::Config});
    }

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parse_error);
    if (doc.isNull() || !doc.isObject()) {
        return Status::err(Error{("invalid JSON in " + path + ": " + parse_error.errorString()).toStdString(),
                                 ErrorKind::Config});
    }

    qCInfo(mendConfigLog) << "loading config file" << path;
    return apply_object(settings, doc.object());
}

// MEND_MAX_RETRIES=5 is treated like {"max_retries": "5"}.
Status apply_environment(Settings& settings) {
    QJsonObject overrides;
    for (const auto* key : {"api_key", "model", "api_url", "max_retries", "timeout_seconds",
                            "temperature", "context_lines", "retry_delay_ms"}) {
        const auto name = QString::fromLatin1(Settings::kEnvPrefix) + QString::fromLatin1(key).toUpper();
        const auto value = qEnvironmentVariable(name.toLatin1().constData());
        if (value.isEmpty()) continue;
        qCDebug(mendConfigLog) << "environment override" << name;
        overrides.insert(QLatin1String(key), value);
    }
    auto applied = apply_object(settings, overrides);
    if (applied.is_err()) return applied;

    if (!settings.has_api_key()) {
        const auto fallback = qEnvironmentVariable("OPENAI_API_KEY");
        if (!fallback.isEmpty()) {
            settings.api_key = fallback.toStdString();
        }
    }
    return Status::ok();
}

Status validate(const Settings& settings) {
    if (settings.max_retries < 1) {
        return Status::err(config_error(QStringLiteral("max_retries"), QStringLiteral("must be at least 1")));
    }
    if (settings.timeout_seconds <= 0 || settings.timeout_seconds > Settings::kMaxTimeoutSeconds) {
        return Status::err(config_error(QStringLiteral("timeout_seconds"),
                                        QStringLiteral("must be between 1 and %1").arg(Settings::kMaxTimeoutSeconds)));
    }
    if (settings.context_lines < 0) {
        return Status::err(config_error(QStringLiteral("context_lines"), QStringLiteral("must not be negative")));
    }
    if (settings.retry_delay_ms < 0) {
        return Status::err(config_error(QStringLiteral("retry_delay_ms"), QStringLiteral("must not be negative")));
    }
    if (settings.temperature < 0.0 || settings.temperature > 2.0) {
        return Status::err(config_error(QStringLiteral("temperature"), QStringLiteral("must be within [0, 2]")));
    }
    if (settings.model.empty()) {
        return Status::err(config_error(QStringLiteral("model"), QStringLiteral("must not be empty")));
    }
    if (settings.api_url.empty()) {
        return Status::err(config_error(QStringLiteral("api_url"), QStringLiteral("must not be empty")));
    }
    return Status::ok();
}

} // namespace

Result<Settings, Error> Settings::load() {
    return load_from({"config.json", user_config_path()});
}

Result<Settings, Error> Settings::load_from(const std::vector<std::string>& config_files) {
    using Out = Result<Settings, Error>;

    Settings settings;
    for (const auto& path : config_files) {
        auto applied = apply_file(settings, QString::fromStdString(path));
        if (applied.is_err()) return Out::err(applied.unwrap_err());
    }

    auto env = apply_environment(settings);
    if (env.is_err()) return Out::err(env.unwrap_err());

    auto valid = validate(settings);
    if (valid.is_err()) return Out::err(valid.unwrap_err());

    if (!settings.has_api_key()) {
        qCWarning(mendConfigLog) << "no API key configured (set MEND_API_KEY or OPENAI_API_KEY)";
    }
    return Out::ok(std::move(settings));
}

Status Settings::save_to(const std::string& path) const {
    const auto qpath = QString::fromStdString(path);
    QDir dir(QFileInfo(qpath).absolutePath());
    if (!dir.mkpath(QStringLiteral("."))) {
        return Status::err(Error{"cannot create config directory for " + path, ErrorKind::Config});
    }

    QJsonObject obj;
    if (api_key) {
        obj.insert(QStringLiteral("api_key"), QString::fromStdString(*api_key));
    }
    obj.insert(QStringLiteral("model"), QString::fromStdString(model));
    obj.insert(QStringLiteral("max_retries"), max_retries);
    obj.insert(QStringLiteral("timeout_seconds"), timeout_seconds);
    obj.insert(QStringLiteral("api_url"), QString::fromStdString(api_url));
    obj.insert(QStringLiteral("temperature"), temperature);
    obj.insert(QStringLiteral("context_lines"), context_lines);
    obj.insert(QStringLiteral("retry_delay_ms"), retry_delay_ms);

    QFile file(qpath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Status::err(Error{"cannot write config file " + path + ": " + file.errorString().toStdString(),
                                 ErrorKind::Config});
    }
    const auto bytes = QJsonDocument(obj).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        return Status::err(Error{"short write to config file " + path, ErrorKind::Config});
    }
    qCInfo(mendConfigLog) << "saved config file" << qpath;
    return Status::ok();
}

Status Settings::save() const {
    return save_to(user_config_path());
}

std::string Settings::user_config_path() {
    return QDir(QDir::homePath()).filePath(QStringLiteral(".config/git-mend/config.json")).toStdString();
}

} // namespace mend
