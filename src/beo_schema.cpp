#include "beo_schema.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace phicore::beo {

namespace {

namespace v1 = phicore::adapter::v1;

QJsonObject responsive(int xs, int sm, int md, int lg, int xl, int xxl)
{
    QJsonObject out;
    out.insert(QStringLiteral("xs"), xs);
    out.insert(QStringLiteral("sm"), sm);
    out.insert(QStringLiteral("md"), md);
    out.insert(QStringLiteral("lg"), lg);
    out.insert(QStringLiteral("xl"), xl);
    out.insert(QStringLiteral("xxl"), xxl);
    return out;
}

QJsonObject field(const QString &key,
                  const QString &type,
                  const QString &label,
                  const QString &description,
                  const QJsonValue &defaultValue = QJsonValue(),
                  const QJsonArray &flags = {})
{
    QJsonObject out;
    out.insert(QStringLiteral("key"), key);
    out.insert(QStringLiteral("type"), type);
    out.insert(QStringLiteral("label"), label);
    out.insert(QStringLiteral("description"), description);
    if (!defaultValue.isUndefined() && !defaultValue.isNull())
        out.insert(QStringLiteral("default"), defaultValue);
    if (!flags.isEmpty())
        out.insert(QStringLiteral("flags"), flags);
    return out;
}

QJsonArray connectionFields()
{
    QJsonArray fields;

    QJsonArray hostFlags;
    hostFlags.append(QStringLiteral("Required"));
    fields.append(field(QStringLiteral("host"),
                        QStringLiteral("Hostname"),
                        QStringLiteral("Device host"),
                        QStringLiteral("IP address or hostname of the Mozart product."),
                        QJsonValue(),
                        hostFlags));

    fields.append(field(QStringLiteral("port"),
                        QStringLiteral("Port"),
                        QStringLiteral("REST port"),
                        QStringLiteral("TCP port of the Mozart REST API."),
                        QJsonValue(80)));

    fields.append(field(QStringLiteral("notificationPort"),
                        QStringLiteral("Port"),
                        QStringLiteral("Notification port"),
                        QStringLiteral("WebSocket port of the notification channel."),
                        QJsonValue(9339)));

    fields.append(field(QStringLiteral("retryIntervalMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Retry interval"),
                        QStringLiteral("Reconnect interval once the fast retries are used up."),
                        QJsonValue(10000)));

    return fields;
}

QJsonArray eventFields()
{
    QJsonArray fields;
    fields.append(field(QStringLiteral("longPressMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Long press"),
                        QStringLiteral("Hold time before a press counts as long."),
                        QJsonValue(1500)));
    fields.append(field(QStringLiteral("veryLongPressMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Very long press"),
                        QStringLiteral("Additional hold time after a long press."),
                        QJsonValue(2000)));
    fields.append(field(QStringLiteral("wheelQuietMs"),
                        QStringLiteral("Integer"),
                        QStringLiteral("Wheel quiet period"),
                        QStringLiteral("Idle time that ends a wheel rotation burst."),
                        QJsonValue(250)));
    return fields;
}

QJsonObject section(const QString &title, const QString &description, const QJsonArray &fields)
{
    QJsonObject layout;
    layout.insert(QStringLiteral("gridUnits"), 24);
    QJsonArray gutter;
    gutter.append(12);
    gutter.append(8);
    layout.insert(QStringLiteral("gutter"), gutter);

    QJsonObject defaults;
    defaults.insert(QStringLiteral("span"), responsive(24, 24, 12, 12, 12, 12));
    defaults.insert(QStringLiteral("labelPosition"), QStringLiteral("Left"));
    defaults.insert(QStringLiteral("labelSpan"), 8);
    defaults.insert(QStringLiteral("controlSpan"), 16);
    defaults.insert(QStringLiteral("actionPosition"), QStringLiteral("Inline"));
    defaults.insert(QStringLiteral("actionSpan"), 6);
    layout.insert(QStringLiteral("defaults"), defaults);

    QJsonObject out;
    out.insert(QStringLiteral("title"), title);
    out.insert(QStringLiteral("description"), description);
    out.insert(QStringLiteral("layout"), layout);
    out.insert(QStringLiteral("fields"), fields);
    return out;
}

v1::AdapterActionDescriptor beolinkAction(const char *id, const char *label, const char *description)
{
    v1::AdapterActionDescriptor action;
    action.id = id;
    action.label = label;
    action.description = description;
    action.metaJson = R"({"placement":"card","kind":"command","requiresAck":true})";
    return action;
}

} // namespace

v1::Utf8String displayName()
{
    return "Bang & Olufsen";
}

v1::Utf8String description()
{
    return "Provides buttons, wheel and Beolink multiroom control for B&O Mozart products";
}

v1::Utf8String iconSvg()
{
    return
        "<svg width=\"24\" height=\"24\" viewBox=\"0 0 24 24\" xmlns=\"http://www.w3.org/2000/svg\" role=\"img\" aria-label=\"B&amp;O logotype\">"
        "<text x=\"12\" y=\"16\" text-anchor=\"middle\" font-family=\"'Geist','Inter','Arial',sans-serif\" font-weight=\"600\" font-size=\"10\" fill=\"currentColor\">B&amp;O</text>"
        "</svg>";
}

v1::AdapterCapabilities capabilities()
{
    v1::AdapterCapabilities caps;
    caps.required = v1::AdapterRequirement::Host
        | v1::AdapterRequirement::UsesRetryInterval;
    caps.optional = v1::AdapterRequirement::Port;
    caps.flags = v1::AdapterFlag::SupportsProbe;

    v1::AdapterActionDescriptor probe;
    probe.id = "probe";
    probe.label = "Test connection";
    probe.description = "Reachability check and Beolink identity lookup";
    probe.metaJson = R"({"placement":"card","kind":"command","requiresAck":true,"resultField":"jid"})";
    caps.factoryActions.push_back(probe);

    caps.instanceActions.push_back(beolinkAction("beolinkJoin",
                                                 "Join Beolink",
                                                 "Join a peer's experience, or the latest one when no peer is given."));
    caps.instanceActions.push_back(beolinkAction("beolinkExpand",
                                                 "Expand Beolink",
                                                 "Add listeners to this device's experience."));
    caps.instanceActions.push_back(beolinkAction("beolinkUnexpand",
                                                 "Unexpand Beolink",
                                                 "Remove listeners from this device's experience."));
    caps.instanceActions.push_back(beolinkAction("beolinkLeave",
                                                 "Leave Beolink",
                                                 "Leave the experience this device listens to."));
    caps.instanceActions.push_back(beolinkAction("beolinkAllStandby",
                                                 "Beolink standby",
                                                 "Put every member of the session into standby."));
    caps.instanceActions.push_back(beolinkAction("beolinkSetVolume",
                                                 "Beolink volume",
                                                 "Set the volume of every session member."));
    caps.instanceActions.push_back(beolinkAction("beolinkSetRelativeVolume",
                                                 "Beolink relative volume",
                                                 "Shift the volume of every session member."));
    caps.instanceActions.push_back(beolinkAction("beolinkLeaderCommand",
                                                 "Beolink leader command",
                                                 "Run a media command on the session leader."));

    caps.defaultsJson = R"({"port":80,"notificationPort":9339,"retryIntervalMs":10000,"longPressMs":1500,"veryLongPressMs":2000,"wheelQuietMs":250})";
    return caps;
}

v1::JsonText configSchemaJson()
{
    QJsonArray fields = connectionFields();
    const QJsonArray events = eventFields();
    for (const QJsonValue &entry : events)
        fields.append(entry);

    QJsonObject schema;
    schema.insert(QStringLiteral("factory"),
                  section(QStringLiteral("Mozart product"),
                          QStringLiteral("Configure connection to a Bang & Olufsen Mozart product."),
                          connectionFields()));
    schema.insert(QStringLiteral("instance"),
                  section(QStringLiteral("Mozart product"),
                          QStringLiteral("Configure connection and button timing."),
                          fields));

    return QJsonDocument(schema).toJson(QJsonDocument::Compact).toStdString();
}

} // namespace phicore::beo
