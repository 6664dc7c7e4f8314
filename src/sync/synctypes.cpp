#include "synctypes.h"

namespace Unison {

QString domainName(SyncDomain domain)
{
    switch (domain) {
        case SyncDomain::Contacts: return "contacts";
        case SyncDomain::Messages: return "messages";
        case SyncDomain::Calls:    return "calls";
        case SyncDomain::Files:    return "files";
    }
    return QString();
}

SyncDomain domainFromName(const QString &name, bool *ok)
{
    const QString key = name.trimmed().toLower();
    if (ok) *ok = true;

    if (key == "contacts") return SyncDomain::Contacts;
    if (key == "messages") return SyncDomain::Messages;
    if (key == "calls" || key == "call_logs") return SyncDomain::Calls;
    if (key == "files") return SyncDomain::Files;

    if (ok) *ok = false;
    return SyncDomain::Contacts;
}

QString errorName(SyncError error)
{
    switch (error) {
        case SyncError::None:                  return QString();
        case SyncError::LockDenied:            return "LockDenied";
        case SyncError::CooldownActive:        return "CooldownActive";
        case SyncError::EmergencyThrottled:    return "EmergencyThrottled";
        case SyncError::DeviceDataUnavailable: return "DeviceDataUnavailable";
        case SyncError::ChecksumMismatch:      return "ChecksumMismatch";
        case SyncError::IOError:               return "IOError";
        case SyncError::ConflictUnresolved:    return "ConflictUnresolved";
    }
    return QString();
}

SyncError errorFromName(const QString &name)
{
    static const QList<SyncError> all = {
        SyncError::LockDenied, SyncError::CooldownActive, SyncError::EmergencyThrottled,
        SyncError::DeviceDataUnavailable, SyncError::ChecksumMismatch, SyncError::IOError,
        SyncError::ConflictUnresolved
    };
    for (SyncError e : all) {
        if (errorName(e) == name) {
            return e;
        }
    }
    return SyncError::None;
}

QString mergeStrategyName(MergeStrategy strategy)
{
    switch (strategy) {
        case MergeStrategy::KeepBoth:     return "keep_both";
        case MergeStrategy::PreferDevice: return "prefer_device";
        case MergeStrategy::PreferLocal:  return "prefer_local";
    }
    return QString();
}

MergeStrategy mergeStrategyFromName(const QString &name, MergeStrategy fallback)
{
    const QString key = name.trimmed().toLower();
    if (key == "keep_both") return MergeStrategy::KeepBoth;
    if (key == "prefer_device") return MergeStrategy::PreferDevice;
    if (key == "prefer_local") return MergeStrategy::PreferLocal;
    return fallback;
}

QString resolutionName(ConflictResolution resolution)
{
    switch (resolution) {
        case ConflictResolution::KeepLocal:  return "keep_local";
        case ConflictResolution::KeepDevice: return "keep_device";
        case ConflictResolution::Merge:      return "merge";
    }
    return QString();
}

ConflictResolution resolutionFromName(const QString &name, bool *ok)
{
    const QString key = name.trimmed().toLower();
    if (ok) *ok = true;

    if (key == "keep_local") return ConflictResolution::KeepLocal;
    if (key == "keep_device") return ConflictResolution::KeepDevice;
    if (key == "merge") return ConflictResolution::Merge;

    if (ok) *ok = false;
    return ConflictResolution::KeepLocal;
}

} // namespace Unison
