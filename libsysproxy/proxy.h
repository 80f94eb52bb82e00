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

#ifndef PROXY_H_
#define PROXY_H_

#ifdef __cplusplus
extern "C" {
#endif

typedef struct _spxProxyConfig spxProxyConfig;

/**
 * Detects the proxy configuration of the system, trying the environment,
 * /etc/sysconfig/proxy, the Windows registry and the macOS system
 * configuration in that order.
 *
 * The returned configuration never changes; call this again to pick up
 * new settings. It may be used from several threads at once.
 *
 * @return The configuration, or NULL if no proxy is configured or no
 *         source could be read
 */
spxProxyConfig  *spx_proxy_config_detect      (void);

/**
 * Get the proxy to use for the specified URL.
 *
 * @url The URL we are trying to reach
 * @return The proxy address (host:port) or NULL to connect directly.
 *         Free with spx_string_free().
 */
char            *spx_proxy_config_select      (spxProxyConfig *self, const char *url);

/**
 * @return NULL-terminated array of "scheme=address" strings, where scheme
 *         is http, https, ftp or * (all schemes). Free with spx_strv_free().
 */
char           **spx_proxy_config_get_proxies (spxProxyConfig *self);

/**
 * @return NULL-terminated array of bypass patterns. Free with spx_strv_free().
 */
char           **spx_proxy_config_get_bypass  (spxProxyConfig *self);

/**
 * @return Non-zero if hosts without a dot are never proxied
 */
int              spx_proxy_config_get_exclude_simple(spxProxyConfig *self);

void             spx_proxy_config_free        (spxProxyConfig *self);
void             spx_strv_free                (char **strv);
void             spx_string_free              (char *str);

#ifdef __cplusplus
}
#endif

#endif /*PROXY_H_*/
