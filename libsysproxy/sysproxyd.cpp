/*******************************************************************************
 * libsysproxy - A library for system proxy detection
 * Copyright (C) 2026 The libsysproxy authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 ******************************************************************************/

#include <gio/gio.h>
#include <stdlib.h>
#include <stdio.h>

/* Import libsysproxy API */
#include "proxy.h"

/* ---------------------------------------------------------------------------------------------------- */

static GDBusNodeInfo *introspection_data = NULL;

/* Introspection data for the service we are exporting */
static const gchar introspection_xml[] =
  "<node>"
  "  <interface name='org.libsysproxy.proxy'>"
  "    <method name='query'>"
  "      <arg type='s' name='url'      direction='in'/>"
  "      <arg type='as' name='response' direction='out'/>"
  "    </method>"
  "    <property type='s' name='APIVersion' access='read'/>"
  "  </interface>"
  "</node>";

/* ---------------------------------------------------------------------------------------------------- */

static void
handle_method_call (GDBusConnection       *connection,
                    const gchar           *sender,
                    const gchar           *object_path,
                    const gchar           *interface_name,
                    const gchar           *method_name,
                    GVariant              *parameters,
                    GDBusMethodInvocation *invocation,
                    gpointer               user_data)
{
  const gchar *url;

  if (g_strcmp0 (method_name, "query") != 0)
    {
      g_dbus_method_invocation_return_error (invocation,
                                             G_DBUS_ERROR,
                                             G_DBUS_ERROR_UNKNOWN_METHOD,
                                             "Unknown method %s",
                                             method_name);
      return;
    }

  g_variant_get (parameters, "(&s)", &url);

  /* Detect on every query, the configuration may have changed meanwhile */
  spxProxyConfig *config = spx_proxy_config_detect ();
  gchar *proxy = config ? spx_proxy_config_select (config, url) : NULL;

  GVariantBuilder *result = g_variant_builder_new (G_VARIANT_TYPE ("as"));
  g_variant_builder_add (result, "s", proxy ? proxy : "direct://");

  g_dbus_method_invocation_return_value (invocation,
                                         g_variant_new ("(as)", result));

  g_variant_builder_unref (result);
  spx_string_free (proxy);
  spx_proxy_config_free (config);
}

static GVariant *
handle_get_property (GDBusConnection  *connection,
                     const gchar      *sender,
                     const gchar      *object_path,
                     const gchar      *interface_name,
                     const gchar      *property_name,
                     GError          **error,
                     gpointer          user_data)
{
  GVariant *ret;

  ret = NULL;
  if (g_strcmp0 (property_name, "APIVersion") == 0)
    {
      ret = g_variant_new_string ("1.0");
    }

  return ret;
}

static const GDBusInterfaceVTable interface_vtable =
{
  handle_method_call,
  handle_get_property
};

/* ---------------------------------------------------------------------------------------------------- */

static void
on_bus_acquired (GDBusConnection *connection,
                 const gchar     *name,
                 gpointer         user_data)
{
  GError *error = NULL;
  guint registration_id;

  registration_id = g_dbus_connection_register_object (connection,
                                                       "/org/libsysproxy/proxy",
                                                       introspection_data->interfaces[0],
                                                       &interface_vtable,
                                                       NULL,  /* user_data */
                                                       NULL,  /* user_data_free_func */
                                                       &error);
  if (registration_id == 0)
    {
      g_critical ("Unable to register object: %s", error->message);
      g_error_free (error);
      exit (1);
    }
}

static void
on_name_acquired (GDBusConnection *connection,
                  const gchar     *name,
                  gpointer         user_data)
{
  g_debug ("Acquired name %s", name);
}

static void
on_name_lost (GDBusConnection *connection,
              const gchar     *name,
              gpointer         user_data)
{
  g_warning ("Lost name %s", name);
  exit (1);
}

int
main (int argc, char *argv[])
{
  GError *error = NULL;
  guint owner_id;
  GMainLoop *loop;

  introspection_data = g_dbus_node_info_new_for_xml (introspection_xml, &error);
  if (introspection_data == NULL)
    {
      g_critical ("Invalid introspection data: %s", error->message);
      g_error_free (error);
      return 1;
    }

  owner_id = g_bus_own_name (G_BUS_TYPE_SESSION,
                             "org.libsysproxy.proxy",
                             G_BUS_NAME_OWNER_FLAGS_NONE,
                             on_bus_acquired,
                             on_name_acquired,
                             on_name_lost,
                             NULL,
                             NULL);

  loop = g_main_loop_new (NULL, FALSE);
  g_main_loop_run (loop);

  g_bus_unown_name (owner_id);
  g_main_loop_unref (loop);

  g_dbus_node_info_unref (introspection_data);

  return 0;
}
